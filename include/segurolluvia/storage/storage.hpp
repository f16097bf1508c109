#pragma once
#include <segurolluvia/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace segurolluvia::storage {

using state_entry_t =
    std::pair<segurolluvia::schema::address_t, segurolluvia::schema::bytes_t>;

/// Raw key-value store addressed by ledger address.
template <typename Library>
struct storage {
  /// Return the bytes stored at address, or std::nullopt when missing.
  std::optional<segurolluvia::schema::bytes_t> get(
      const segurolluvia::schema::address_t& address) const;

  /// Store bytes at address. Returns the addresses actually written; empty
  /// when the backend refused the write.
  std::vector<segurolluvia::schema::address_t> set(
      const segurolluvia::schema::address_t& address,
      const segurolluvia::schema::bytes_view_t& value) const;

  /// Return all entries whose address starts with the prefix.
  std::vector<state_entry_t> list_by_prefix(
      const segurolluvia::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              bool read_only = false);

}  // namespace segurolluvia::storage
