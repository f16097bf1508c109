#include <blake3.h>
#include <segurolluvia/blake3/hash.hpp>

namespace segurolluvia::blake3 {

namespace {

template <typename Output>
Output finalize(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = Output{};
  // Lengths above BLAKE3_OUT_LEN read further into the XOF stream.
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

segurolluvia::schema::hash32_t hash(const std::string_view& str) {
  return finalize<segurolluvia::schema::hash32_t>(str.data(), str.size());
}

segurolluvia::schema::hash32_t hash(
    const segurolluvia::schema::bytes_view_t& bytes) {
  return finalize<segurolluvia::schema::hash32_t>(bytes.data(), bytes.size());
}

segurolluvia::schema::hash64_t hash_wide(const std::string_view& str) {
  return finalize<segurolluvia::schema::hash64_t>(str.data(), str.size());
}

}  // namespace segurolluvia::blake3
