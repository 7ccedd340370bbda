#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace trackchain::common {

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Formatting variant for faults that carry backend detail (RocksDB status,
/// offending key, ...).
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace trackchain::common
