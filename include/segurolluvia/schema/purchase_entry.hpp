#pragma once

#include <segurolluvia/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <string>

// Schema type: purchase entry.
// Persisted policy for one purchase id. Created by buy, refund mutated by
// calculate and getData, never deleted.
namespace segurolluvia::schema {

template <uint16_t Version>
struct purchase_entry;

template <>
struct purchase_entry<1> final {
  uint16_t version{1};
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
  uint64_t refund{};
  /// Price as received, integer values rendered in decimal.
  std::string total;

  bool operator==(const purchase_entry<1>&) const = default;
};

using purchase_entry_t = purchase_entry<1>;

/// Value stored at one address. Keyed by purchase id because distinct ids
/// may share a truncated digest suffix.
using policy_record_t = std::map<purchase_id_t, purchase_entry_t>;

}  // namespace segurolluvia::schema
