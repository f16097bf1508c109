#pragma once

#include <segurolluvia/schema/primitives.hpp>
#include <segurolluvia/schema/verb.hpp>
#include <cstdint>
#include <string>

// Schema type: purchase request.
// Fully typed payload produced by the field validator.
namespace segurolluvia::schema {

template <uint16_t Version>
struct purchase_request;

template <>
struct purchase_request<1> final {
  uint16_t version{1};
  verb_t verb{verb_t::buy};
  std::string name;
  std::string mail;
  /// Digits as received; leading zeros are significant.
  std::string bank_account;
  std::string place_address;
  std::string town;
  std::string province;
  std::string checkin_date;
  std::string checkout_date;
  int64_t days{};
  std::string rain_amount;
  std::string start_hour;
  std::string end_hour;
  /// Initial refund for buy, delta for calculate and getData.
  int64_t refund{};
  purchase_id_t purchase;
  /// Price as received, integer values rendered in decimal.
  std::string total;
};

using purchase_request_t = purchase_request<1>;

}  // namespace segurolluvia::schema
