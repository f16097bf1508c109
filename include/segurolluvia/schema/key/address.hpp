#pragma once
#include <segurolluvia/schema/primitives.hpp>
#include <string_view>

// Schema key type: address.
// Ledger addresses are the family namespace prefix followed by the tail of a
// 64 byte digest of the purchase id. Distinct ids are assumed never to share
// a tail; records stay keyed by purchase id in case they do.
namespace segurolluvia::schema::key {

/// First bytes of the BLAKE3 digest of the family name.
namespace_prefix_t make_namespace_prefix(std::string_view family_name);

address_t make_address(const namespace_prefix_t& prefix,
                       std::string_view purchase_id);

bool in_namespace(const namespace_prefix_t& prefix, const address_t& address);

std::string to_hex(const namespace_prefix_t& prefix);

}  // namespace segurolluvia::schema::key
