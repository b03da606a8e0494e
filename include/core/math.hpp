#pragma once

#include <algorithm>
#include <cmath>

namespace sla_agent::core {

// Non-finite ratios map to 0.
inline double clamp01(const double value) noexcept {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

// NaN and infinities collapse to 0 so nothing unbounded reaches a gauge.
inline double finite_or_zero(const double value) noexcept {
  return std::isfinite(value) ? value : 0.0;
}

}  // namespace sla_agent::core
