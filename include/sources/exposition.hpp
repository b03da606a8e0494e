#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sla_agent::sources {

// Finds the first sample line for `metric_name` in Prometheus text exposition
// and returns its value. The label block, if any, is ignored; so is a trailing
// timestamp. Returns nullopt when no line matches or the value is not a finite
// non-negative number.
std::optional<double> parse_metric_value(std::string_view exposition, const std::string& metric_name);

}  // namespace sla_agent::sources
