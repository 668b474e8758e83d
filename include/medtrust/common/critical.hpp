#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace medtrust::common {

/// Log at critical level, flush sinks, and terminate. Reserved for broken
/// local invariants (corrupt storage, failed allocation in OpenSSL); domain
/// failures are reported as values instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

inline void ensure(const bool condition, const std::string_view message) {
  if (!condition) {
    critical(message);
  }
}

}  // namespace medtrust::common
