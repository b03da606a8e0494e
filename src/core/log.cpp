#include "core/log.hpp"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace sla_agent::core {
namespace {

std::atomic<int> g_threshold{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mu;

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

void format_utc_now(char (&buffer)[32]) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) {
    buffer[0] = '\0';
  }
}

}  // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
  const std::string lower = lowercase(name);
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::kWarning;
  }
  if (lower == "error" || lower == "critical") {
    return LogLevel::kError;
  }

  // Numeric thresholds such as 10 or 20 round up to the next named level.
  char* end = nullptr;
  errno = 0;
  const long numeric = std::strtol(lower.c_str(), &end, 10);
  if (lower.empty() || errno != 0 || end != lower.c_str() + lower.size()) {
    return std::nullopt;
  }
  if (numeric <= static_cast<long>(LogLevel::kDebug)) {
    return LogLevel::kDebug;
  }
  if (numeric <= static_cast<long>(LogLevel::kInfo)) {
    return LogLevel::kInfo;
  }
  if (numeric <= static_cast<long>(LogLevel::kWarning)) {
    return LogLevel::kWarning;
  }
  return LogLevel::kError;
}

const char* log_level_name(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

void set_log_level(const LogLevel level) noexcept {
  g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(g_threshold.load(std::memory_order_relaxed));
}

bool log_enabled(const LogLevel level) noexcept {
  return static_cast<int>(level) >= g_threshold.load(std::memory_order_relaxed);
}

void log_line(const LogLevel level, const char* tag, const std::string& message) {
  if (!log_enabled(level)) {
    return;
  }

  char stamp[32]{};
  format_utc_now(stamp);

  std::lock_guard<std::mutex> lock(g_write_mu);
  std::cerr << stamp << ' ' << log_level_name(level) << " [" << tag << "] " << message << '\n';
}

}  // namespace sla_agent::core
