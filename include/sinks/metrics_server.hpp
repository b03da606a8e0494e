#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "sinks/sla_metrics.hpp"

namespace sla_agent::sinks {

struct MetricsServerOptions {
  std::string bind_address{"0.0.0.0"};
  // 0 picks an ephemeral port; see bound_port().
  std::uint16_t port{9091};
};

// Serves /metrics, /status and /healthz from a single background thread.
class MetricsServer {
 public:
  MetricsServer(MetricsServerOptions options, const SlaMetrics& metrics);
  ~MetricsServer();

  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  bool start();
  void stop();

  [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_.load(); }

  // Builds the full HTTP response for one request line; exposed for tests.
  [[nodiscard]] std::string respond(const std::string& method, const std::string& target) const;

 private:
  void accept_loop();
  void handle_connection(int client_fd) const;

  MetricsServerOptions options_;
  const SlaMetrics& metrics_;

  int listen_fd_{-1};
  std::atomic<bool> running_{false};
  std::atomic<std::uint16_t> bound_port_{0};
  std::mutex lifecycle_mu_;
  std::thread worker_{};
};

}  // namespace sla_agent::sinks
