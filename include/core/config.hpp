#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "core/log.hpp"

namespace sla_agent::core {

struct ProberConfig {
  std::string metrics_url{"http://oncall-prober:9081/metrics"};
  std::string success_metric{"prober_create_user_scenario_success_total"};
  std::string fail_metric{"prober_create_user_scenario_success_fail_total"};
  double request_timeout_s{5.0};
};

struct ServerConfig {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t port{9091};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"sla"};
  bool enabled{false};
};

struct AgentConfig {
  std::chrono::seconds scrape_interval{30};
  std::size_t window_size{12};
  LogLevel log_level{LogLevel::kInfo};
  bool stdout_debug{false};
  ProberConfig prober{};
  ServerConfig server{};
  RedisConfig redis{};
};

using EnvLookup = std::function<const char*(const char*)>;

AgentConfig load_agent_config(const std::string& path);

// Applies SLA_* environment variables on top of `config`. Values are validated
// like file values and a bad one throws std::runtime_error.
void apply_env_overrides(AgentConfig& config, const EnvLookup& lookup);

void apply_config_value(AgentConfig& config, const std::string& key, const std::string& value);

}  // namespace sla_agent::core
