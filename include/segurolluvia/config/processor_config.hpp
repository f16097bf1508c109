#pragma once

#include <segurolluvia/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace segurolluvia::config {

inline constexpr std::string_view kDefaultFamilyName{"segurolluvia"};
inline constexpr std::string_view kDefaultFamilyVersion{"1.0.0"};

/// Constants shared by the validator, the address deriver and the
/// transition engine. Built once at startup and passed by reference.
struct processor_config final {
  std::string family_name{kDefaultFamilyName};
  std::string family_version{kDefaultFamilyVersion};
  segurolluvia::schema::namespace_prefix_t namespace_prefix{};
  uint64_t min_refund{0};
  uint64_t max_refund{4294967295u};
  std::size_t max_name_length{20};
  std::size_t bank_account_digits{16};
};

/// Build a configuration for the family, deriving its namespace prefix.
processor_config make_processor_config(
    std::string_view family_name = kDefaultFamilyName,
    std::string_view family_version = kDefaultFamilyVersion);

/// Check internal consistency. On failure `error` holds the reason.
bool validate_config(const processor_config& config, std::string& error);

}  // namespace segurolluvia::config
