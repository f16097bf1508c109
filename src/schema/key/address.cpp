#include <segurolluvia/blake3/hash.hpp>
#include <segurolluvia/schema/key/address.hpp>

#include <algorithm>
#include <iterator>

namespace segurolluvia::schema::key {

namespace_prefix_t make_namespace_prefix(std::string_view family_name) {
  auto digest = segurolluvia::blake3::hash(family_name);
  auto prefix = namespace_prefix_t{};
  std::copy_n(std::begin(digest), prefix.size(), std::begin(prefix));
  return prefix;
}

address_t make_address(const namespace_prefix_t& prefix,
                       std::string_view purchase_id) {
  constexpr auto kSuffixSize = std::tuple_size_v<address_t> -
                               std::tuple_size_v<namespace_prefix_t>;
  auto digest = segurolluvia::blake3::hash_wide(purchase_id);
  auto address = address_t{};
  auto out = std::copy(std::begin(prefix), std::end(prefix), std::begin(address));
  std::copy(std::end(digest) - kSuffixSize, std::end(digest), out);
  return address;
}

bool in_namespace(const namespace_prefix_t& prefix, const address_t& address) {
  return std::equal(std::begin(prefix), std::end(prefix), std::begin(address));
}

std::string to_hex(const namespace_prefix_t& prefix) {
  return segurolluvia::schema::to_hex(
      bytes_view_t{prefix.data(), prefix.size()});
}

}  // namespace segurolluvia::schema::key
