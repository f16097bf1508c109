#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace segurolluvia::common {

/// Log, flush and terminate. Reserved for environment failures that leave
/// no transaction to reject (database cannot be opened, encoder failure).
/// `detail` is the backend's own error text, when there is one.
[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail = {}) {
  if (detail.empty()) {
    spdlog::critical("{}", message);
  } else {
    spdlog::critical("{}: {}", message, detail);
  }
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace segurolluvia::common
