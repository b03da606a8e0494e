#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "core/config.hpp"
#include "model/sla_frame.hpp"
#include "sinks/redis_latest.hpp"
#include "sinks/sla_metrics.hpp"
#include "sinks/stdout_debug.hpp"
#include "sla/interval_calculator.hpp"
#include "sla/ratio_window.hpp"
#include "sources/counter_source.hpp"

namespace sla_agent::core {

struct AgentStats {
  std::size_t cycles_executed{0};
  std::size_t fetch_failures{0};
  std::size_t recorded_intervals{0};
  std::size_t skipped_intervals{0};
  std::size_t sink_errors{0};
};

// Drives fetch -> compute -> publish -> sleep. Owns the aggregation state;
// the metrics it publishes are owned by the caller so an HTTP server can read
// them concurrently.
class Agent {
 public:
  Agent(AgentConfig config, std::unique_ptr<sources::CounterSource> source, sinks::SlaMetrics& metrics);

  // One cycle without the trailing sleep.
  model::sla_frame run_cycle(AgentStats& stats);

  // Runs cycles until `stop_requested` returns true. It is checked before each
  // cycle and while sleeping between cycles.
  AgentStats run_until(const std::function<bool()>& stop_requested);

  [[nodiscard]] const sla::IntervalCalculator& calculator() const noexcept { return calculator_; }
  [[nodiscard]] const sla::RatioWindow& window() const noexcept { return window_; }

 private:
  void publish_sinks(const model::sla_frame& frame, AgentStats& stats);
  void sleep_between_cycles(const std::function<bool()>& stop_requested) const;

  std::chrono::seconds scrape_interval_;
  bool publish_stdout_{false};
  std::unique_ptr<sources::CounterSource> source_;
  sinks::SlaMetrics& metrics_;
  std::uint64_t cycle_{0};

  sla::IntervalCalculator calculator_{};
  sla::RatioWindow window_;

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisLatestSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace sla_agent::core
