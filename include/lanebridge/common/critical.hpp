#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace lanebridge::common {

/// Report an unrecoverable fault and stop the process.
///
/// Reserved for a broken store or a violated internal invariant. Anything a
/// peer or relayer can cause is reported through bridge_error_code instead,
/// so untrusted input never reaches this path.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace lanebridge::common
