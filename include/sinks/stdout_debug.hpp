#pragma once

#include <cstdio>

#include "model/sla_frame.hpp"

namespace sla_agent::sinks {

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) : out_(out) {}

  void publish(const model::sla_frame& frame) const;

 private:
  std::FILE* out_;
};

}  // namespace sla_agent::sinks
