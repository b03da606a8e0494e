#include "sla/interval_calculator.hpp"

#include <sstream>

#include "core/log.hpp"
#include "core/math.hpp"

namespace sla_agent::sla {

double IntervalCalculator::counter_delta(const double current, const std::optional<double> previous) noexcept {
  double delta = previous.has_value() ? current - *previous : current;
  if (delta < 0.0) {
    // Counter went backwards: the upstream process restarted.
    delta = current;
  }
  if (delta < 0.0) {
    delta = 0.0;
  }
  return delta;
}

std::optional<double> IntervalCalculator::compute_interval(const std::optional<double> success_total,
                                                           const std::optional<double> fail_total) {
  if (!success_total.has_value() && !fail_total.has_value()) {
    core::log_warning("sla", "both success and fail totals are missing; skipping this interval");
    return std::nullopt;
  }

  const double success = success_total.value_or(0.0);
  const double fail = fail_total.value_or(0.0);

  const double delta_success = counter_delta(success, previous_success_);
  const double delta_fail = counter_delta(fail, previous_fail_);

  previous_success_ = success;
  previous_fail_ = fail;

  const double delta_total = delta_success + delta_fail;
  if (!(delta_total > 0.0)) {
    core::log_info("sla", "no prober events in this interval; window left unchanged");
    return std::nullopt;
  }

  if (core::log_enabled(core::LogLevel::kDebug)) {
    std::ostringstream message;
    message << "interval delta_success=" << delta_success << " delta_fail=" << delta_fail;
    core::log_debug("sla", message.str());
  }

  return core::clamp01(delta_success / delta_total);
}

}  // namespace sla_agent::sla
