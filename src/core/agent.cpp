#include "core/agent.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/log.hpp"
#include "core/timestamp.hpp"

namespace sla_agent::core {
namespace {

constexpr std::chrono::milliseconds kSleepSlice{100};

std::string format_ratio(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << value;
  return out.str();
}

}  // namespace

Agent::Agent(AgentConfig config, std::unique_ptr<sources::CounterSource> source, sinks::SlaMetrics& metrics)
    : scrape_interval_(config.scrape_interval),
      publish_stdout_(config.stdout_debug),
      source_(std::move(source)),
      metrics_(metrics),
      window_(config.window_size) {
  if (source_ == nullptr) {
    throw std::invalid_argument("agent requires a counter source");
  }

  metrics_.set_window({}, window_.capacity());

  if (config.redis.enabled) {
    sinks::RedisLatestOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisLatestSink>(options);

    if (redis_sink_->check_connectivity()) {
      log_info("agent", "redis connectivity confirmed at " + redis_sink_->describe_endpoint());
    } else {
      log_warning("agent", "redis connectivity check failed at " + redis_sink_->describe_endpoint());
    }
  }
}

model::sla_frame Agent::run_cycle(AgentStats& stats) {
  metrics_.calculations.inc();
  ++cycle_;

  model::sla_frame frame{};
  frame.cycle = cycle_;
  frame.snapshot = source_->fetch();
  frame.timestamp_ms = unix_timestamp_now_ms();

  metrics_.request_duration_seconds.set(frame.snapshot.duration_seconds);
  metrics_.set_last_fetch_ok(!frame.snapshot.empty());
  if (frame.snapshot.empty()) {
    ++stats.fetch_failures;
  }

  frame.interval_ratio = calculator_.compute_interval(frame.snapshot.success_total, frame.snapshot.fail_total);
  if (frame.interval_ratio.has_value()) {
    frame.current_ratio = *frame.interval_ratio;
    window_.push(*frame.interval_ratio);
    ++stats.recorded_intervals;
    log_info("sla", "interval ratio " + format_ratio(frame.current_ratio) + " (success_delta / total_delta)");
  } else {
    frame.current_ratio = 0.0;
    ++stats.skipped_intervals;
    log_debug("sla", "interval ratio undefined; current gauge set to 0, window unchanged");
  }
  metrics_.current_ratio.set(frame.current_ratio);

  const auto window_average = window_.average();
  frame.window_ratio = window_average.value_or(0.0);
  frame.window_fill = window_.size();
  metrics_.window_ratio.set(frame.window_ratio);
  metrics_.set_window(window_.values(), window_.capacity());
  if (window_average.has_value()) {
    log_info("sla", "window ratio (avg of last " + std::to_string(frame.window_fill) +
                        " intervals): " + format_ratio(frame.window_ratio));
  } else {
    log_debug("sla", "window is empty; window gauge set to 0");
  }

  publish_sinks(frame, stats);
  ++stats.cycles_executed;
  return frame;
}

AgentStats Agent::run_until(const std::function<bool()>& stop_requested) {
  AgentStats stats{};
  while (!stop_requested()) {
    run_cycle(stats);
    log_debug("agent", "waiting " + std::to_string(scrape_interval_.count()) + " seconds for next cycle");
    sleep_between_cycles(stop_requested);
  }
  return stats;
}

void Agent::publish_sinks(const model::sla_frame& frame, AgentStats& stats) {
  if (publish_stdout_) {
    stdout_sink_.publish(frame);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(frame);
    if (!ok) {
      ++stats.sink_errors;
      if (redis_was_ok_) {
        log_error("redis", "publish to " + redis_sink_->describe_endpoint() + " failed");
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      log_info("redis", "publish recovered");
      redis_was_ok_ = true;
    }
  }
}

void Agent::sleep_between_cycles(const std::function<bool()>& stop_requested) const {
  const auto deadline = std::chrono::steady_clock::now() + scrape_interval_;
  while (!stop_requested()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kSleepSlice));
  }
}

}  // namespace sla_agent::core
