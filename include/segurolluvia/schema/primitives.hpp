#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace segurolluvia::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using hash64_t = std::array<uint8_t, 64>;

/// Leading bytes of every address owned by this transaction family.
using namespace_prefix_t = std::array<uint8_t, 3>;

/// Namespace prefix followed by the purchase id digest suffix.
using address_t = std::array<uint8_t, 35>;

using purchase_id_t = std::string;

bytes_t make_bytes(const std::string_view& bytes);

/// Lowercase, no prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);

/// Accepts an optional "0x" prefix and either case. Surrounding ASCII
/// whitespace is ignored so hex files with a trailing newline decode.
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace segurolluvia::schema
