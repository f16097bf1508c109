#pragma once
#include <segurolluvia/schema/primitives.hpp>
#include <optional>

namespace segurolluvia::schema::encoding {

/// Wire codec shared by payloads and stored records. Specialised per
/// library tag.
template <typename Library>
struct encoder {
  template <typename T>
  segurolluvia::schema::bytes_t encode(const T& obj) const;

  /// std::nullopt when the bytes are not a valid T. Used on every input
  /// that crosses the ledger boundary.
  template <typename T>
  std::optional<T> try_decode(
      const segurolluvia::schema::bytes_view_t& bytes) const;

  /// For bytes this process produced itself; failure is fatal.
  template <typename T>
  T decode(const segurolluvia::schema::bytes_view_t& bytes) const;
};

}  // namespace segurolluvia::schema::encoding
