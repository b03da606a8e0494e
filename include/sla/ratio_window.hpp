#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace sla_agent::sla {

// Fixed-capacity FIFO of interval ratios. Every retained interval weighs the
// same in the average, however many events it covered.
class RatioWindow {
 public:
  explicit RatioWindow(std::size_t capacity);

  // Evicts the oldest ratio once the window is full. Values are clamped to [0, 1].
  void push(double ratio);

  [[nodiscard]] std::optional<double> average() const;

  [[nodiscard]] std::size_t size() const noexcept { return ratios_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] bool empty() const noexcept { return ratios_.empty(); }

  [[nodiscard]] std::vector<double> values() const;

 private:
  std::size_t capacity_;
  std::deque<double> ratios_{};
};

}  // namespace sla_agent::sla
