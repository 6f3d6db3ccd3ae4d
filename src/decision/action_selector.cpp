#include "decision/action_selector.hpp"

#include <algorithm>
#include <iostream>

namespace sle_agent::decision {

std::string select_action(const std::string& sle_type, const core::StrategyMap& strategies) {
  const auto it = strategies.find(sle_type);
  if (it == strategies.end() || it->second.empty()) {
    std::cerr << "[decision] no remediation strategy for SLE type " << sle_type << ", defaulting to "
              << kDefaultAction << '\n';
    return kDefaultAction;
  }

  // min_element returns the first of equal minima.
  const auto& candidates = it->second;
  const auto best = std::min_element(candidates.begin(), candidates.end(),
                                     [](const core::RemediationStrategy& a, const core::RemediationStrategy& b) {
                                       return a.priority < b.priority;
                                     });
  return best->action;
}

}  // namespace sle_agent::decision
