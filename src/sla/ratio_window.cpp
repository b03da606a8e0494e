#include "sla/ratio_window.hpp"

#include <numeric>
#include <stdexcept>

#include "core/math.hpp"

namespace sla_agent::sla {

RatioWindow::RatioWindow(const std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("ratio window capacity must be greater than 0");
  }
}

void RatioWindow::push(const double ratio) {
  if (ratios_.size() == capacity_) {
    ratios_.pop_front();
  }
  ratios_.push_back(core::clamp01(ratio));
}

std::optional<double> RatioWindow::average() const {
  if (ratios_.empty()) {
    return std::nullopt;
  }
  const double sum = std::accumulate(ratios_.begin(), ratios_.end(), 0.0);
  return sum / static_cast<double>(ratios_.size());
}

std::vector<double> RatioWindow::values() const {
  return std::vector<double>(ratios_.begin(), ratios_.end());
}

}  // namespace sla_agent::sla
