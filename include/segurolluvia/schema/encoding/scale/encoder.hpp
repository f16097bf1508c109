#pragma once
#include <segurolluvia/common/critical.hpp>
#include <segurolluvia/schema/encoding/encoder.hpp>
#include <segurolluvia/schema/encoding/scale/purchase_entry.hpp>
#include <scale/scale.hpp>
#include <utility>

namespace segurolluvia::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  segurolluvia::schema::bytes_t encode(const T& obj) const {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      segurolluvia::common::critical("SCALE encoding failed");
    }
    return std::move(encoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(
      const segurolluvia::schema::bytes_view_t& bytes) const {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }

  template <typename T>
  T decode(const segurolluvia::schema::bytes_view_t& bytes) const {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      segurolluvia::common::critical("SCALE decoding failed",
                                     segurolluvia::schema::to_hex(bytes));
    }
    return std::move(*decoded);
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace segurolluvia::schema::encoding
