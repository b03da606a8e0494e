#pragma once

#include "model/counter_snapshot.hpp"

namespace sla_agent::sources {

class CounterSource {
 public:
  virtual ~CounterSource() = default;

  // Never throws; failures come back as absent totals.
  virtual model::CounterSnapshot fetch() = 0;
};

}  // namespace sla_agent::sources
