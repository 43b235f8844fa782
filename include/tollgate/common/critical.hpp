#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tollgate::common {

/// Log an unrecoverable fault, flush every sink and terminate the process.
///
/// Reserved for broken storage or corrupt persisted records. Governance
/// refusals are never routed through here.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Same as `critical`, naming the component and the offending key.
[[noreturn]] inline void critical(const std::string_view component,
                                  const std::string_view message,
                                  const std::string_view key) {
  spdlog::critical("[{}] {} (key='{}')", component, message, key);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tollgate::common
