#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace custody::common {

/// Report a host-level fault (storage or codec failure) and terminate.
///
/// Ledger operation errors never come through here; they are returned as
/// typed results to the caller.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace custody::common
