#pragma once

#include <segurolluvia/schema/transaction_error_code.hpp>
#include <string>

namespace segurolluvia::schema {

/// Business rule violation reported by the validator or the transition.
struct rejection_t final {
  transaction_error_code code{};
  std::string reason;
};

}  // namespace segurolluvia::schema
