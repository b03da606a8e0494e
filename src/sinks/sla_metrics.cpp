#include "sinks/sla_metrics.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace sla_agent::sinks {
namespace {

void write_metric(std::ostringstream& out, const char* name, const char* type, const char* help, const double value) {
  out << "# HELP " << name << ' ' << help << '\n';
  out << "# TYPE " << name << ' ' << type << '\n';
  out << name << ' ' << value << '\n';
}

}  // namespace

void SlaMetrics::set_window(std::vector<double> ratios, const std::size_t capacity) {
  std::lock_guard<std::mutex> lock(window_mu_);
  window_ = std::move(ratios);
  window_capacity_ = capacity;
}

std::string SlaMetrics::render_prometheus() const {
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10);

  write_metric(out, "sla_current_ratio", "gauge",
               "SLA ratio for the most recent interval (success / total), value in range [0,1]",
               current_ratio.value());
  write_metric(out, "sla_window_ratio", "gauge",
               "SLA ratio aggregated over the sliding window (average of recent interval ratios), value in range [0,1]",
               window_ratio.value());

  out << "# HELP sla_calculation Total number of SLA calculation runs\n";
  out << "# TYPE sla_calculation counter\n";
  out << "sla_calculation_total " << calculations.value() << '\n';

  write_metric(out, "sla_prober_request_duration_seconds", "gauge",
               "Duration in seconds to fetch metrics from the prober", request_duration_seconds.value());
  return out.str();
}

nlohmann::json SlaMetrics::status_json() const {
  nlohmann::json status{
      {"current_ratio", current_ratio.value()},
      {"window_ratio", window_ratio.value()},
      {"calculations", calculations.value()},
      {"request_duration_seconds", request_duration_seconds.value()},
      {"last_fetch_ok", last_fetch_ok_.load(std::memory_order_relaxed)},
  };

  std::lock_guard<std::mutex> lock(window_mu_);
  status["window"] = {
      {"capacity", window_capacity_},
      {"size", window_.size()},
      {"ratios", window_},
  };
  return status;
}

}  // namespace sla_agent::sinks
