#pragma once

#include <optional>

namespace sla_agent::model {

// One scrape of the prober's counters. An absent total means the metric was
// not present in the scrape (or the scrape failed), which is not the same as 0.
struct CounterSnapshot {
  std::optional<double> success_total{};
  std::optional<double> fail_total{};
  double duration_seconds{0.0};

  [[nodiscard]] bool empty() const noexcept { return !success_total.has_value() && !fail_total.has_value(); }
};

}  // namespace sla_agent::model
