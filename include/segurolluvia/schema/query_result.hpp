#pragma once

#include <segurolluvia/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Read path envelope: SCALE encoded purchase entry plus the address it was
// read from.
namespace segurolluvia::schema {

enum class query_error_code : uint32_t {
  not_found = 1,
  state_decode_failed = 2,
};

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  address_t key{};
  bytes_t value;
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace segurolluvia::schema
