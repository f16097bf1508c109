#pragma once

#include <cstdint>

namespace segurolluvia::schema {

enum class transaction_error_code : uint32_t {
  // Internal faults: environment problems, not invalid transactions.
  payload_decode_failed = 1,
  state_decode_failed = 2,
  state_write_failed = 3,

  // Field validation.
  field_type_mismatch = 9,
  verb_missing = 10,
  verb_unrecognized = 11,
  name_missing = 12,
  name_too_long = 13,
  mail_missing = 14,
  mail_invalid = 15,
  bank_account_missing = 16,
  bank_account_invalid = 17,
  place_address_missing = 18,
  town_missing = 19,
  province_missing = 20,
  checkin_date_missing = 21,
  checkout_date_missing = 22,
  days_missing = 23,
  days_invalid = 24,
  rain_amount_missing = 25,
  start_hour_missing = 26,
  end_hour_missing = 27,
  refund_missing = 28,
  refund_invalid = 29,
  purchase_missing = 30,
  total_missing = 31,

  // State transition.
  purchase_exists = 40,
  purchase_not_found = 41,
  refund_below_minimum = 42,
  refund_above_maximum = 43,
};

constexpr bool is_internal_error(const transaction_error_code code) {
  return code == transaction_error_code::payload_decode_failed ||
         code == transaction_error_code::state_decode_failed ||
         code == transaction_error_code::state_write_failed;
}

}  // namespace segurolluvia::schema
