#pragma once

#include <optional>
#include <string>

namespace sla_agent::core {

enum class LogLevel : int {
  kDebug = 10,
  kInfo = 20,
  kWarning = 30,
  kError = 40,
};

// Accepts debug, info, warning (or warn), error and critical, case-insensitive,
// or a numeric threshold (10, 20, 30, 40, 50).
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level) noexcept;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;
[[nodiscard]] bool log_enabled(LogLevel level) noexcept;

// Writes "<utc time> <LEVEL> [tag] message" to stderr.
void log_line(LogLevel level, const char* tag, const std::string& message);

inline void log_debug(const char* tag, const std::string& message) { log_line(LogLevel::kDebug, tag, message); }
inline void log_info(const char* tag, const std::string& message) { log_line(LogLevel::kInfo, tag, message); }
inline void log_warning(const char* tag, const std::string& message) { log_line(LogLevel::kWarning, tag, message); }
inline void log_error(const char* tag, const std::string& message) { log_line(LogLevel::kError, tag, message); }

}  // namespace sla_agent::core
