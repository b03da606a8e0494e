#pragma once

#include <chrono>
#include <string>

#include "model/counter_snapshot.hpp"
#include "sources/counter_source.hpp"

namespace sla_agent::sources {

struct ProberScrapeOptions {
  std::string url{"http://oncall-prober:9081/metrics"};
  std::string success_metric{"prober_create_user_scenario_success_total"};
  std::string fail_metric{"prober_create_user_scenario_success_fail_total"};
  std::chrono::milliseconds timeout{5000};
};

// Scrapes the prober's /metrics page with one blocking GET per fetch().
// Transport errors, timeouts and non-200 answers all yield an empty snapshot;
// the duration is measured in every case.
class ProberScrapeSource final : public CounterSource {
 public:
  explicit ProberScrapeSource(ProberScrapeOptions options);

  model::CounterSnapshot fetch() override;

  [[nodiscard]] const ProberScrapeOptions& options() const noexcept { return options_; }

 private:
  ProberScrapeOptions options_;
};

}  // namespace sla_agent::sources
