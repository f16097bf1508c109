#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/schema/key/address.hpp>

#include <fmt/format.h>

namespace segurolluvia::config {

processor_config make_processor_config(std::string_view family_name,
                                       std::string_view family_version) {
  auto config = processor_config{};
  config.family_name = std::string{family_name};
  config.family_version = std::string{family_version};
  config.namespace_prefix =
      segurolluvia::schema::key::make_namespace_prefix(family_name);
  return config;
}

bool validate_config(const processor_config& config, std::string& error) {
  if (config.family_name.empty()) {
    error = "family name must not be empty";
    return false;
  }
  if (config.family_version.empty()) {
    error = "family version must not be empty";
    return false;
  }
  if (config.namespace_prefix !=
      segurolluvia::schema::key::make_namespace_prefix(config.family_name)) {
    error = fmt::format("namespace prefix does not match family '{}'",
                        config.family_name);
    return false;
  }
  if (config.min_refund > config.max_refund) {
    error = fmt::format("refund bounds are inverted: [{}, {}]",
                        config.min_refund, config.max_refund);
    return false;
  }
  if (config.max_name_length == 0) {
    error = "max name length must be positive";
    return false;
  }
  // Longer accounts could not be sent as an integer payload value.
  if (config.bank_account_digits == 0 || config.bank_account_digits > 19) {
    error = fmt::format("bank account digits must be in [1, 19], got {}",
                        config.bank_account_digits);
    return false;
  }
  return true;
}

}  // namespace segurolluvia::config
