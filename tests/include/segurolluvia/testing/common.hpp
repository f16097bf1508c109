#pragma once

#include <segurolluvia/schema/encoding/scale/encoder.hpp>
#include <segurolluvia/schema/payload.hpp>
#include <segurolluvia/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace segurolluvia::testing {

using scale_encoder_t = segurolluvia::schema::encoding::scale_encoder_t;

/// Payload with every field valid for the given verb and purchase id.
inline segurolluvia::schema::payload_t make_payload(
    const std::string_view verb,
    const std::string_view purchase,
    const int64_t refund) {
  return segurolluvia::schema::payload_t{
      {"verb", std::string{verb}},
      {"name", std::string{"Ana"}},
      {"mail", std::string{"a@x.com"}},
      {"bankAccount", int64_t{1234567890123456}},
      {"placeAddress", std::string{"Calle Mayor 1"}},
      {"town", std::string{"Santiago"}},
      {"province", std::string{"A Coruna"}},
      {"checkinDate", std::string{"2024-07-01"}},
      {"checkoutDate", std::string{"2024-07-08"}},
      {"days", int64_t{7}},
      {"rainAmount", std::string{"fuerte"}},
      {"startHour", std::string{"09:00"}},
      {"endHour", std::string{"21:00"}},
      {"refund", refund},
      {"purchase", std::string{purchase}},
      {"total", int64_t{500}}};
}

inline segurolluvia::schema::bytes_t encode_payload(
    const segurolluvia::schema::payload_t& payload) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(payload);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace segurolluvia::testing
