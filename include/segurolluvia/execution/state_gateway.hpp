#pragma once

#include <segurolluvia/schema/primitives.hpp>
#include <segurolluvia/storage/storage.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace segurolluvia::execution {

/// Read/write contract against the ledger state store.
///
/// `get` returns std::nullopt (or empty bytes) when nothing is stored.
/// `set` returns the addresses written; an empty result means the write did
/// not take effect and the transaction fails as an internal error.
struct state_gateway final {
  std::function<std::optional<segurolluvia::schema::bytes_t>(
      const segurolluvia::schema::address_t& address)>
      get;
  std::function<std::vector<segurolluvia::schema::address_t>(
      const segurolluvia::schema::address_t& address,
      const segurolluvia::schema::bytes_view_t& value)>
      set;
};

/// Bind a gateway to a storage backend. The storage must outlive it.
template <typename Library>
state_gateway make_state_gateway(
    segurolluvia::storage::storage<Library>& storage) {
  return state_gateway{
      .get = [&storage](const segurolluvia::schema::address_t& address) {
        return storage.get(address);
      },
      .set = [&storage](const segurolluvia::schema::address_t& address,
                        const segurolluvia::schema::bytes_view_t& value) {
        return storage.set(address, value);
      }};
}

}  // namespace segurolluvia::execution
