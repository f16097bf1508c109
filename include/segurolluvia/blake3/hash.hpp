#pragma once
#include <segurolluvia/schema/primitives.hpp>
#include <string_view>

namespace segurolluvia::blake3 {

segurolluvia::schema::hash32_t hash(const std::string_view& str);
segurolluvia::schema::hash32_t hash(const segurolluvia::schema::bytes_view_t& bytes);

/// 64 byte extended output, used where a wider digest is truncated.
segurolluvia::schema::hash64_t hash_wide(const std::string_view& str);

}  // namespace segurolluvia::blake3
