#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: family info.
// Registration data the ledger uses to route transactions to this handler.
namespace segurolluvia::schema {

template <uint16_t Version>
struct family_info;

template <>
struct family_info<1> final {
  uint16_t version{1};
  std::string family_name;
  std::vector<std::string> family_versions;
  std::vector<std::string> namespaces;
};

using family_info_t = family_info<1>;

}  // namespace segurolluvia::schema
