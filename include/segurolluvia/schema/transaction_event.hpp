#pragma once

#include <segurolluvia/schema/verb.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Emitted once per applied transaction so the ledger can index policies by
// purchase id and address.
namespace segurolluvia::schema {

struct event_attribute_t final {
  std::string key;
  std::string value;
  bool index{false};
};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

constexpr std::string_view event_type(const verb_t verb) {
  switch (verb) {
    case verb_t::buy:
      return "purchase_created";
    case verb_t::calculate:
      return "refund_decreased";
    case verb_t::get_data:
      return "refund_increased";
  }
  return "unknown";
}

}  // namespace segurolluvia::schema
