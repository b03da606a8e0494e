#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sla_agent::core {
namespace {

constexpr double kMaxRequestTimeoutSeconds = 3600.0;
constexpr long long kMaxScrapeIntervalSeconds = 86400;

struct EnvBinding {
  const char* variable;
  const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"SLA_PROBER_METRICS_URL", "prober.metrics_url"},
    {"SLA_SCRAPE_INTERVAL", "sla.scrape_interval_s"},
    {"SLA_WINDOW_SIZE", "sla.window_size"},
    {"SLA_METRICS_PORT", "server.port"},
    {"SLA_LOG_LEVEL", "log_level"},
    {"SLA_PROBER_SUCCESS_METRIC", "prober.success_metric"},
    {"SLA_PROBER_FAIL_METRIC", "prober.fail_metric"},
    {"SLA_PROBER_REQUEST_TIMEOUT", "prober.request_timeout_s"},
};

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto parsed = parse_integer(key, value);
  if (parsed <= 0 || parsed > 65535) {
    throw std::runtime_error(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed);
}

void require_non_empty(const std::string& key, const std::string& value) {
  if (value.empty()) {
    throw std::runtime_error(key + " must not be empty");
  }
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port("redis.address port", value.substr(split + 1));
}

}  // namespace

void apply_config_value(AgentConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "prober.metrics_url") {
    require_non_empty(key, value);
    config.prober.metrics_url = value;
    return;
  }

  if (key == "prober.success_metric") {
    require_non_empty(key, value);
    config.prober.success_metric = value;
    return;
  }

  if (key == "prober.fail_metric") {
    require_non_empty(key, value);
    config.prober.fail_metric = value;
    return;
  }

  if (key == "prober.request_timeout_s") {
    const double timeout = parse_double(key, value);
    if (!std::isfinite(timeout) || timeout <= 0.0 || timeout > kMaxRequestTimeoutSeconds) {
      throw std::runtime_error("prober.request_timeout_s must be in range (0, 3600]");
    }
    config.prober.request_timeout_s = timeout;
    return;
  }

  if (key == "sla.scrape_interval_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0 || seconds > kMaxScrapeIntervalSeconds) {
      throw std::runtime_error("sla.scrape_interval_s must be in range 1..86400");
    }
    config.scrape_interval = std::chrono::seconds(seconds);
    return;
  }

  if (key == "sla.window_size") {
    const auto size = parse_integer(key, value);
    if (size <= 0) {
      throw std::runtime_error("sla.window_size must be greater than 0");
    }
    config.window_size = static_cast<std::size_t>(size);
    return;
  }

  if (key == "server.bind_address") {
    config.server.bind_address = value;
    return;
  }

  if (key == "server.port") {
    config.server.port = parse_port(key, value);
    return;
  }

  if (key == "log_level") {
    const auto level = parse_log_level(value);
    if (!level.has_value()) {
      throw std::runtime_error("log_level must be one of debug, info, warning, error, critical or a numeric level; got '" + value + "'");
    }
    config.log_level = *level;
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.key_prefix") {
    require_non_empty(key, value);
    config.redis.key_prefix = value;
    return;
  }

  log_warning("config", "ignoring unknown key " + key);
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  // Open sections with the indent width of their header line.
  std::vector<std::pair<std::size_t, std::string>> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    while (!sections.empty() && sections.back().first >= indent_spaces) {
      sections.pop_back();
    }

    if (value.empty()) {
      sections.emplace_back(indent_spaces, key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      full_key << section.second << '.';
    }
    full_key << key;

    apply_config_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(AgentConfig& config, const EnvLookup& lookup) {
  for (const auto& binding : kEnvBindings) {
    const char* raw = lookup(binding.variable);
    if (raw == nullptr) {
      continue;
    }
    const std::string value = trim(raw);
    if (value.empty()) {
      continue;
    }
    try {
      apply_config_value(config, binding.key, value);
    } catch (const std::runtime_error& ex) {
      throw std::runtime_error(std::string(binding.variable) + ": " + ex.what());
    }
  }
}

}  // namespace sla_agent::core
