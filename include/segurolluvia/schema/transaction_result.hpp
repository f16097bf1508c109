#pragma once

#include <segurolluvia/schema/primitives.hpp>
#include <segurolluvia/schema/transaction_error_code.hpp>
#include <segurolluvia/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace segurolluvia::schema {

inline constexpr std::string_view kValidationCodespace{
    "segurolluvia.validation"};
inline constexpr std::string_view kTransitionCodespace{
    "segurolluvia.transition"};
inline constexpr std::string_view kInternalCodespace{"segurolluvia.internal"};

template <uint16_t Version>
struct transaction_result;

/// Outcome of one payload. `code` is 0 on success, otherwise a
/// transaction_error_code value.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;

  bool ok() const { return code == 0; }
  bool internal_error() const {
    return code != 0 &&
           is_internal_error(static_cast<transaction_error_code>(code));
  }
};

using transaction_result_t = transaction_result<1>;

}  // namespace segurolluvia::schema
