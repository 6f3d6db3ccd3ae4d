#pragma once

#include "model/remediation.hpp"

namespace sle_agent::sinks {

class StdoutSummarySink {
 public:
  void publish(const model::workflow_outcome& outcome) const;
};

}  // namespace sle_agent::sinks
