#include "sinks/stdout_summary.hpp"

#include <cstdio>
#include <string>

#include "report/json_report.hpp"

namespace sle_agent::sinks {

void StdoutSummarySink::publish(const model::workflow_outcome& outcome) const {
  const std::string line = report::serialize(report::summary_json(outcome));
  std::printf("[summary] %s\n", line.c_str());
  std::fflush(stdout);
}

}  // namespace sle_agent::sinks
