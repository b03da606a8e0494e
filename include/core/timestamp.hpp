#pragma once

#include <chrono>
#include <cstdint>

namespace sla_agent::core {

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline double seconds_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace sla_agent::core
