#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <limits>
#include <optional>

namespace sla_agent::sinks {
namespace {

double or_nan(const std::optional<double>& value) {
  return value.has_value() ? *value : std::numeric_limits<double>::quiet_NaN();
}

}  // namespace

void StdoutDebugSink::publish(const model::sla_frame& frame) const {
  std::fprintf(out_, "[cycle %llu] success_total=%.1f fail_total=%.1f fetch_s=%.3f interval=%.4f current=%.4f window=%.4f fill=%zu\n",
               static_cast<unsigned long long>(frame.cycle), or_nan(frame.snapshot.success_total),
               or_nan(frame.snapshot.fail_total), frame.snapshot.duration_seconds, or_nan(frame.interval_ratio),
               frame.current_ratio, frame.window_ratio, frame.window_fill);
  std::fflush(out_);
}

}  // namespace sla_agent::sinks
