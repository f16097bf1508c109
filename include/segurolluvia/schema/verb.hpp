#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: verb.
// Operation discriminator carried in every payload: create a policy,
// decrement its refund, or increment its refund. The wire names are fixed by
// existing clients.
namespace segurolluvia::schema {

enum class verb_t : uint8_t { buy = 0, calculate = 1, get_data = 2 };

inline constexpr auto kVerbNames = std::array{
    std::pair<std::string_view, verb_t>{"buy", verb_t::buy},
    std::pair<std::string_view, verb_t>{"calculate", verb_t::calculate},
    std::pair<std::string_view, verb_t>{"getData", verb_t::get_data}};

/// Exact, case sensitive match on the wire name.
constexpr std::optional<verb_t> try_parse_verb(const std::string_view name) {
  for (const auto& [wire_name, verb] : kVerbNames) {
    if (wire_name == name) {
      return verb;
    }
  }
  return std::nullopt;
}

constexpr std::string_view to_string(const verb_t verb) {
  for (const auto& [wire_name, value] : kVerbNames) {
    if (value == verb) {
      return wire_name;
    }
  }
  return "unknown";
}

}  // namespace segurolluvia::schema
