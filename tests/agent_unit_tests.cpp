#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "model/counter_snapshot.hpp"
#include "sinks/redis_latest.hpp"
#include "sinks/sla_metrics.hpp"
#include "sinks/stdout_debug.hpp"
#include "sources/counter_source.hpp"

using sla_agent::core::Agent;
using sla_agent::core::AgentConfig;
using sla_agent::core::AgentStats;
using sla_agent::core::LogLevel;
using sla_agent::core::apply_env_overrides;
using sla_agent::core::load_agent_config;
using sla_agent::model::CounterSnapshot;
using sla_agent::model::sla_frame;
using sla_agent::sinks::RedisLatestOptions;
using sla_agent::sinks::RedisLatestSink;
using sla_agent::sinks::SlaMetrics;
using sla_agent::sources::CounterSource;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
  int connect_calls{0};
};

RedisMockState g_redis_mock{};

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  g_redis_mock.connect_calls += 1;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  g_redis_mock.connect_calls += 1;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char*, ...) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_INTEGER;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

namespace {

// Replays canned snapshots; an exhausted script behaves like an unreachable prober.
class ScriptedSource final : public CounterSource {
 public:
  explicit ScriptedSource(std::deque<CounterSnapshot> script) : script_(std::move(script)) {}

  CounterSnapshot fetch() override {
    if (script_.empty()) {
      return CounterSnapshot{std::nullopt, std::nullopt, 0.0};
    }
    CounterSnapshot next = script_.front();
    script_.pop_front();
    return next;
  }

 private:
  std::deque<CounterSnapshot> script_;
};

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::string redis_field(const std::string& field) {
  for (std::size_t i = 2; i + 1 < g_redis_mock.last_argv.size(); i += 2) {
    if (g_redis_mock.last_argv[i] == field) {
      return g_redis_mock.last_argv[i + 1];
    }
  }
  return {};
}

std::unique_ptr<ScriptedSource> make_source(std::deque<CounterSnapshot> script) {
  return std::make_unique<ScriptedSource>(std::move(script));
}

int test_end_to_end_two_cycles() {
  SlaMetrics metrics;
  AgentConfig config{};
  config.window_size = 12;
  Agent agent(config, make_source({{10.0, 0.0, 0.01}, {15.0, 5.0, 0.02}}), metrics);

  AgentStats stats{};
  const sla_frame first = agent.run_cycle(stats);
  if (!first.interval_ratio.has_value() || !almost_equal(first.current_ratio, 1.0)) {
    return fail("test_end_to_end_two_cycles", "first cycle should give ratio 1.0");
  }

  const sla_frame second = agent.run_cycle(stats);
  if (!almost_equal(second.current_ratio, 0.5) || !almost_equal(metrics.current_ratio.value(), 0.5)) {
    return fail("test_end_to_end_two_cycles", "second cycle should give ratio 0.5");
  }

  const std::vector<double> expected{1.0, 0.5};
  if (agent.window().values() != expected) {
    return fail("test_end_to_end_two_cycles", "window should be [1.0, 0.5]");
  }
  if (!almost_equal(second.window_ratio, 0.75) || !almost_equal(metrics.window_ratio.value(), 0.75)) {
    return fail("test_end_to_end_two_cycles", "window average should be 0.75");
  }
  if (metrics.calculations.value() != 2 || stats.cycles_executed != 2 || stats.recorded_intervals != 2) {
    return fail("test_end_to_end_two_cycles", "expected two counted cycles");
  }
  if (!almost_equal(metrics.request_duration_seconds.value(), 0.02)) {
    return fail("test_end_to_end_two_cycles", "duration gauge should hold the latest fetch");
  }

  const auto status = metrics.status_json();
  if (status["window"]["size"].get<std::size_t>() != 2 || status["window"]["capacity"].get<std::size_t>() != 12) {
    return fail("test_end_to_end_two_cycles", "status window snapshot not published");
  }

  return 0;
}

int test_idle_interval_publishes_zero() {
  SlaMetrics metrics;
  Agent agent(AgentConfig{}, make_source({{10.0, 2.0, 0.01}, {10.0, 2.0, 0.01}}), metrics);

  AgentStats stats{};
  (void)agent.run_cycle(stats);
  const sla_frame idle = agent.run_cycle(stats);

  if (idle.interval_ratio.has_value() || !almost_equal(metrics.current_ratio.value(), 0.0)) {
    return fail("test_idle_interval_publishes_zero", "idle interval should publish current ratio 0");
  }
  if (agent.window().size() != 1 || stats.skipped_intervals != 1) {
    return fail("test_idle_interval_publishes_zero", "idle interval must not touch the window");
  }
  if (!almost_equal(metrics.window_ratio.value(), 10.0 / 12.0)) {
    return fail("test_idle_interval_publishes_zero", "window ratio should keep the earlier interval");
  }

  return 0;
}

int test_failed_fetch_degrades_to_placeholders() {
  SlaMetrics metrics;
  Agent agent(AgentConfig{}, make_source({{std::nullopt, std::nullopt, 0.25}}), metrics);

  AgentStats stats{};
  const sla_frame frame = agent.run_cycle(stats);

  if (frame.interval_ratio.has_value() || !almost_equal(metrics.current_ratio.value(), 0.0) ||
      !almost_equal(metrics.window_ratio.value(), 0.0)) {
    return fail("test_failed_fetch_degrades_to_placeholders", "gauges should read 0 after a failed fetch");
  }
  if (!almost_equal(metrics.request_duration_seconds.value(), 0.25)) {
    return fail("test_failed_fetch_degrades_to_placeholders", "duration should be published even on failure");
  }
  if (metrics.calculations.value() != 1 || stats.fetch_failures != 1) {
    return fail("test_failed_fetch_degrades_to_placeholders", "failed cycle should still be counted");
  }
  if (agent.calculator().previous_success().has_value()) {
    return fail("test_failed_fetch_degrades_to_placeholders", "failed fetch must not seed the previous totals");
  }
  if (metrics.status_json()["last_fetch_ok"].get<bool>()) {
    return fail("test_failed_fetch_degrades_to_placeholders", "status should report the failed fetch");
  }

  return 0;
}

int test_run_until_checks_stop_before_each_cycle() {
  SlaMetrics metrics;
  AgentConfig config{};
  config.scrape_interval = std::chrono::seconds(3600);
  Agent agent(config, make_source({{1.0, 0.0, 0.0}}), metrics);

  int polls = 0;
  const AgentStats stats = agent.run_until([&polls] { return ++polls > 1; });
  if (stats.cycles_executed != 1) {
    return fail("test_run_until_checks_stop_before_each_cycle", "expected exactly one cycle before stopping");
  }

  Agent stopped(config, make_source({}), metrics);
  const AgentStats none = stopped.run_until([] { return true; });
  if (none.cycles_executed != 0) {
    return fail("test_run_until_checks_stop_before_each_cycle", "no cycle should start once stop is requested");
  }

  return 0;
}

int test_config_file_parsing() {
  const auto config_path = std::filesystem::temp_directory_path() / "sla_agent_config_parse.yaml";
  {
    std::ofstream out(config_path);
    out << "# sla agent\n";
    out << "log_level: debug\n";
    out << "prober:\n";
    out << "  metrics_url: http://127.0.0.1:9081/metrics   # local prober\n";
    out << "  success_metric: \"probe_ok_total\"\n";
    out << "  fail_metric: probe_failed_total\n";
    out << "  request_timeout_s: 2.5\n";
    out << "sla:\n";
    out << "  scrape_interval_s: 15\n";
    out << "  window_size: 4\n";
    out << "server:\n";
    out << "  bind_address: 127.0.0.1\n";
    out << "  port: 9191\n";
    out << "agent:\n";
    out << "  stdout_debug: yes\n";
    out << "redis:\n";
    out << "  address: unix:///run/redis.sock\n";
    out << "  key_prefix: edge:sla\n";
  }

  AgentConfig config{};
  try {
    config = load_agent_config(config_path.string());
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return fail("test_config_file_parsing", "valid config rejected");
  }

  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (config.prober.metrics_url != "http://127.0.0.1:9081/metrics" || config.prober.success_metric != "probe_ok_total" ||
      config.prober.fail_metric != "probe_failed_total" || !almost_equal(config.prober.request_timeout_s, 2.5)) {
    return fail("test_config_file_parsing", "prober section mismatch");
  }
  if (config.scrape_interval != std::chrono::seconds(15) || config.window_size != 4) {
    return fail("test_config_file_parsing", "sla section mismatch");
  }
  if (config.server.bind_address != "127.0.0.1" || config.server.port != 9191) {
    return fail("test_config_file_parsing", "server section mismatch");
  }
  if (config.log_level != LogLevel::kDebug || !config.stdout_debug) {
    return fail("test_config_file_parsing", "top-level keys mismatch");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/run/redis.sock" || config.redis.key_prefix != "edge:sla") {
    return fail("test_config_file_parsing", "redis section mismatch");
  }

  return 0;
}

int test_config_rejects_invalid_values() {
  const std::vector<std::string> bad_documents = {
      "sla:\n  window_size: 0\n",
      "sla:\n  scrape_interval_s: -5\n",
      "prober:\n  request_timeout_s: 0\n",
      "server:\n  port: 70000\n",
      "log_level: chatty\n",
      "prober:\n  success_metric: \"\"\n",
      "sla:\n  scrape_interval_s: 86401\n",
      "sla:\n  scrape_interval_s: 10000000000\n",
  };

  const auto config_path = std::filesystem::temp_directory_path() / "sla_agent_config_invalid.yaml";
  for (const auto& document : bad_documents) {
    {
      std::ofstream out(config_path);
      out << document;
    }

    bool threw = false;
    try {
      (void)load_agent_config(config_path.string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << document;
      return fail("test_config_rejects_invalid_values", "expected load_agent_config to reject the document");
    }
  }

  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  bool threw = false;
  try {
    (void)load_agent_config("/nonexistent/sla-agent.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_config_rejects_invalid_values", "missing file should be an error");
  }

  return 0;
}

int test_config_nested_four_space_sections() {
  const auto config_path = std::filesystem::temp_directory_path() / "sla_agent_config_nested.yaml";
  {
    std::ofstream out(config_path);
    out << "prober:\n"
           "    tls:\n"
           "        verify: true\n"
           "    metrics_url: http://prober.internal:9081/metrics\n"
           "sla:\n"
           "    window_size: 4\n"
           "log_level: debug\n";
  }

  AgentConfig config{};
  try {
    config = load_agent_config(config_path.string());
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return fail("test_config_nested_four_space_sections", "four-space document should load");
  }

  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (config.prober.metrics_url != "http://prober.internal:9081/metrics" || config.window_size != 4 ||
      config.log_level != LogLevel::kDebug) {
    return fail("test_config_nested_four_space_sections", "keys after a deeper section were misplaced");
  }
  return 0;
}

int test_log_level_names() {
  using sla_agent::core::parse_log_level;

  if (parse_log_level("CRITICAL") != LogLevel::kError || parse_log_level("warn") != LogLevel::kWarning) {
    return fail("test_log_level_names", "named levels not recognised");
  }
  if (parse_log_level("10") != LogLevel::kDebug || parse_log_level("20") != LogLevel::kInfo ||
      parse_log_level("30") != LogLevel::kWarning || parse_log_level("50") != LogLevel::kError) {
    return fail("test_log_level_names", "numeric levels not recognised");
  }
  if (parse_log_level("chatty").has_value() || parse_log_level("").has_value() || parse_log_level("20x").has_value()) {
    return fail("test_log_level_names", "garbage should not parse");
  }
  return 0;
}

int test_stdout_sink_line() {
  std::FILE* capture = std::tmpfile();
  if (capture == nullptr) {
    return fail("test_stdout_sink_line", "tmpfile unavailable");
  }

  sla_frame frame{};
  frame.cycle = 3;
  frame.snapshot.success_total = 12.0;
  frame.snapshot.fail_total = 4.0;
  frame.interval_ratio = 0.75;
  frame.current_ratio = 0.75;
  frame.window_ratio = 0.5;
  frame.window_fill = 2;

  sla_agent::sinks::StdoutDebugSink sink(capture);
  sink.publish(frame);

  std::rewind(capture);
  char buffer[512]{};
  const bool read_ok = std::fgets(buffer, sizeof(buffer), capture) != nullptr;
  std::fclose(capture);
  if (!read_ok) {
    return fail("test_stdout_sink_line", "nothing written");
  }

  const std::string line(buffer);
  if (line.rfind("[cycle 3] ", 0) != 0 || line.find("success_total=12.0") == std::string::npos ||
      line.find("current=0.7500") == std::string::npos || line.find("window=0.5000") == std::string::npos ||
      line.find("fill=2") == std::string::npos) {
    std::cerr << line;
    return fail("test_stdout_sink_line", "unexpected summary line");
  }
  return 0;
}

int test_env_overrides() {
  const std::map<std::string, std::string> env = {
      {"SLA_PROBER_METRICS_URL", "http://prober.internal/metrics"},
      {"SLA_SCRAPE_INTERVAL", "10"},
      {"SLA_WINDOW_SIZE", "3"},
      {"SLA_METRICS_PORT", "9200"},
      {"SLA_LOG_LEVEL", "WARNING"},
      {"SLA_PROBER_SUCCESS_METRIC", "ok_total"},
      {"SLA_PROBER_FAIL_METRIC", "ko_total"},
      {"SLA_PROBER_REQUEST_TIMEOUT", "0.5"},
  };
  const auto lookup = [&env](const char* name) -> const char* {
    const auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  };

  AgentConfig config{};
  apply_env_overrides(config, lookup);

  if (config.prober.metrics_url != "http://prober.internal/metrics" || config.scrape_interval != std::chrono::seconds(10) ||
      config.window_size != 3 || config.server.port != 9200 || config.log_level != LogLevel::kWarning ||
      config.prober.success_metric != "ok_total" || config.prober.fail_metric != "ko_total" ||
      !almost_equal(config.prober.request_timeout_s, 0.5)) {
    return fail("test_env_overrides", "environment values not applied");
  }

  AgentConfig untouched{};
  apply_env_overrides(untouched, [](const char*) -> const char* { return nullptr; });
  if (untouched.window_size != 12 || untouched.server.port != 9091 || untouched.scrape_interval != std::chrono::seconds(30)) {
    return fail("test_env_overrides", "defaults changed without environment");
  }

  bool threw = false;
  try {
    apply_env_overrides(untouched, [](const char* name) -> const char* {
      return std::string(name) == "SLA_METRICS_PORT" ? "70000" : nullptr;
    });
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("SLA_METRICS_PORT") != std::string::npos;
  }
  if (!threw) {
    return fail("test_env_overrides", "bad environment value should name the variable");
  }

  return 0;
}

int test_redis_sink_writes_latest_hash() {
  g_redis_mock = {};

  RedisLatestOptions options;
  options.key_prefix = "sla:test";
  RedisLatestSink sink(options);

  sla_frame frame{};
  frame.cycle = 7;
  frame.current_ratio = 0.5;
  frame.window_ratio = 0.75;
  frame.window_fill = 2;
  frame.snapshot = CounterSnapshot{15.0, 5.0, 0.125};
  frame.timestamp_ms = 1700000000000ULL;

  if (!sink.publish(frame)) {
    return fail("test_redis_sink_writes_latest_hash", "publish should succeed with mock redis");
  }
  if (g_redis_mock.command_argv_calls != 1) {
    return fail("test_redis_sink_writes_latest_hash", "expected one HSET call");
  }
  if (g_redis_mock.last_argv.size() < 2 || g_redis_mock.last_argv[0] != "HSET" ||
      g_redis_mock.last_argv[1] != "sla:test:sla") {
    return fail("test_redis_sink_writes_latest_hash", "HSET on the prefixed hash not emitted");
  }
  if (redis_field("current_ratio") != "0.500000" || redis_field("window_ratio") != "0.750000" ||
      redis_field("window_fill") != "2" || redis_field("calculations") != "7" || redis_field("fetch_ok") != "1" ||
      redis_field("updated_ms") != "1700000000000") {
    return fail("test_redis_sink_writes_latest_hash", "hash fields mismatch");
  }

  return 0;
}

int test_agent_publishes_to_redis_each_cycle() {
  g_redis_mock = {};

  SlaMetrics metrics;
  AgentConfig config{};
  config.redis.enabled = true;
  config.redis.key_prefix = "edge";
  Agent agent(config, make_source({{10.0, 0.0, 0.0}}), metrics);

  AgentStats stats{};
  (void)agent.run_cycle(stats);
  (void)agent.run_cycle(stats);

  if (g_redis_mock.command_argv_calls != 2 || stats.sink_errors != 0) {
    return fail("test_agent_publishes_to_redis_each_cycle", "expected one HSET per cycle");
  }
  if (redis_field("fetch_ok") != "0" || redis_field("current_ratio") != "0.000000" ||
      redis_field("window_ratio") != "1.000000") {
    return fail("test_agent_publishes_to_redis_each_cycle", "second cycle should publish the failed fetch");
  }

  return 0;
}

}  // namespace

int main() {
  sla_agent::core::set_log_level(LogLevel::kError);

  if (int rc = test_end_to_end_two_cycles(); rc != 0) return rc;
  if (int rc = test_idle_interval_publishes_zero(); rc != 0) return rc;
  if (int rc = test_failed_fetch_degrades_to_placeholders(); rc != 0) return rc;
  if (int rc = test_run_until_checks_stop_before_each_cycle(); rc != 0) return rc;
  if (int rc = test_config_file_parsing(); rc != 0) return rc;
  if (int rc = test_config_rejects_invalid_values(); rc != 0) return rc;
  if (int rc = test_config_nested_four_space_sections(); rc != 0) return rc;
  if (int rc = test_log_level_names(); rc != 0) return rc;
  if (int rc = test_env_overrides(); rc != 0) return rc;
  if (int rc = test_stdout_sink_line(); rc != 0) return rc;
  if (int rc = test_redis_sink_writes_latest_hash(); rc != 0) return rc;
  if (int rc = test_agent_publishes_to_redis_each_cycle(); rc != 0) return rc;

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}
