#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "model/counter_snapshot.hpp"

namespace sla_agent::model {

// Result of one loop cycle, handed to every sink.
struct sla_frame {
  std::uint64_t timestamp_ms{0};
  std::uint64_t cycle{0};

  CounterSnapshot snapshot{};

  // Absent when the interval had no events or both counters were missing.
  std::optional<double> interval_ratio{};

  // Published values; 0 stands in for "undefined".
  double current_ratio{0.0};
  double window_ratio{0.0};
  std::size_t window_fill{0};
};

}  // namespace sla_agent::model
