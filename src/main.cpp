#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <curl/curl.h>

#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "sinks/metrics_server.hpp"
#include "sinks/sla_metrics.hpp"
#include "sources/prober_scrape.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

class CurlGlobal {
 public:
  CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
  ~CurlGlobal() {
    if (ok_) {
      curl_global_cleanup();
    }
  }

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;

  [[nodiscard]] bool ok() const noexcept { return ok_; }

 private:
  bool ok_;
};

}  // namespace

std::string format_config_settings(const sla_agent::core::AgentConfig& config, const std::string& config_source) {
  std::ostringstream output;
  output << "loaded config from " << config_source
         << " | prober_metrics_url=" << config.prober.metrics_url
         << " | success_metric=" << config.prober.success_metric
         << " | fail_metric=" << config.prober.fail_metric
         << " | request_timeout_s=" << config.prober.request_timeout_s
         << " | scrape_interval_s=" << config.scrape_interval.count()
         << " | window_size=" << config.window_size
         << " | metrics_address=" << config.server.bind_address << ':' << config.server.port
         << " | log_level=" << sla_agent::core::log_level_name(config.log_level)
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "";

  sla_agent::core::AgentConfig config{};
  try {
    if (!config_path.empty()) {
      config = sla_agent::core::load_agent_config(config_path);
    }
    sla_agent::core::apply_env_overrides(config, [](const char* name) { return std::getenv(name); });
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  sla_agent::core::set_log_level(config.log_level);
  sla_agent::core::log_info("agent", "starting SLA aggregator");
  sla_agent::core::log_info("agent", format_config_settings(config, config_path.empty() ? "defaults" : config_path));

  CurlGlobal curl_global;
  if (!curl_global.ok()) {
    sla_agent::core::log_error("agent", "curl_global_init failed");
    return 1;
  }

  sla_agent::sinks::SlaMetrics metrics;
  sla_agent::sinks::MetricsServer server({config.server.bind_address, config.server.port}, metrics);
  if (!server.start()) {
    sla_agent::core::log_error("agent", "unable to start metrics server; exiting");
    return 1;
  }

  sla_agent::sources::ProberScrapeOptions scrape{};
  scrape.url = config.prober.metrics_url;
  scrape.success_metric = config.prober.success_metric;
  scrape.fail_metric = config.prober.fail_metric;
  scrape.timeout = std::chrono::milliseconds(static_cast<long long>(config.prober.request_timeout_s * 1000.0));

  try {
    sla_agent::core::Agent agent{config, std::make_unique<sla_agent::sources::ProberScrapeSource>(scrape), metrics};
    const auto stats = agent.run_until([] { return g_shutdown_requested != 0; });
    sla_agent::core::log_info("agent", "ran " + std::to_string(stats.cycles_executed) + " cycles (" +
                                           std::to_string(stats.fetch_failures) + " without data, " +
                                           std::to_string(stats.recorded_intervals) + " recorded)");
  } catch (const std::exception& ex) {
    sla_agent::core::log_error("agent", std::string("fatal: ") + ex.what());
    server.stop();
    return 1;
  }

  server.stop();
  sla_agent::core::log_info("agent", "received termination signal; exiting cleanly");
  return 0;
}
