#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sla_agent::sinks {

// Lock-free scalar for one writer and any number of readers.
class Gauge {
 public:
  void set(double value) noexcept { value_.store(value, std::memory_order_relaxed); }
  [[nodiscard]] double value() const noexcept { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<double> value_{0.0};
};

class Counter {
 public:
  void inc() noexcept { value_.fetch_add(1, std::memory_order_relaxed); }
  [[nodiscard]] std::uint64_t value() const noexcept { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> value_{0};
};

// Everything the SLA loop publishes. The loop writes, the HTTP server reads.
class SlaMetrics {
 public:
  Gauge current_ratio{};
  Gauge window_ratio{};
  Counter calculations{};
  Gauge request_duration_seconds{};

  void set_window(std::vector<double> ratios, std::size_t capacity);
  void set_last_fetch_ok(bool ok) noexcept { last_fetch_ok_.store(ok, std::memory_order_relaxed); }

  // Prometheus text exposition format 0.0.4.
  [[nodiscard]] std::string render_prometheus() const;
  [[nodiscard]] nlohmann::json status_json() const;

 private:
  mutable std::mutex window_mu_;
  std::vector<double> window_{};
  std::size_t window_capacity_{0};
  std::atomic<bool> last_fetch_ok_{false};
};

}  // namespace sla_agent::sinks
