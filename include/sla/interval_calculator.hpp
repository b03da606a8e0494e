#pragma once

#include <optional>

namespace sla_agent::sla {

// Turns successive raw counter totals into per-interval success ratios.
//
// A total that goes down is treated as a counter reset: the current value is
// taken as the number of events since the reset. This undercounts whatever
// happened between the last scrape before the reset and the reset itself.
class IntervalCalculator {
 public:
  // Returns the success ratio of the interval since the previous call, in
  // [0, 1], or nullopt when both totals are absent or no events happened.
  // Appending the ratio to a window is left to the caller.
  std::optional<double> compute_interval(std::optional<double> success_total, std::optional<double> fail_total);

  [[nodiscard]] std::optional<double> previous_success() const noexcept { return previous_success_; }
  [[nodiscard]] std::optional<double> previous_fail() const noexcept { return previous_fail_; }

  [[nodiscard]] static double counter_delta(double current, std::optional<double> previous) noexcept;

 private:
  std::optional<double> previous_success_{};
  std::optional<double> previous_fail_{};
};

}  // namespace sla_agent::sla
