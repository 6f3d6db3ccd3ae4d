#include "decision/severity.hpp"

#include <cmath>
#include <sstream>

namespace sle_agent::decision {

model::severity classify(const double score, const core::SeverityThresholds& thresholds) noexcept {
  if (std::isnan(score) || score < thresholds.critical) {
    return model::severity::CRITICAL;
  }
  if (score < thresholds.high) {
    return model::severity::HIGH;
  }
  if (score < thresholds.medium) {
    return model::severity::MEDIUM;
  }
  return model::severity::LOW;
}

RemediationDecision should_remediate(const double score, const double threshold) {
  std::ostringstream reason;
  if (score >= threshold) {
    reason << "SLE score " << score << " is at or above threshold " << threshold;
    return RemediationDecision{false, reason.str()};
  }

  reason << "SLE score " << score << " below threshold " << threshold << ", remediation recommended";
  return RemediationDecision{true, reason.str()};
}

std::string ticket_priority(const std::string& sle_type, const std::optional<model::severity> level,
                            const std::unordered_map<std::string, std::string>& priority_map) {
  std::string priority = "normal";
  if (level.has_value()) {
    const auto it = priority_map.find(model::to_string(*level));
    if (it != priority_map.end()) {
      priority = it->second;
    }
  }

  const bool infrastructure_critical = sle_type == "gateway-availability" || sle_type == "dhcp-performance";
  if (infrastructure_critical && priority != "urgent") {
    priority = "high";
  }
  return priority;
}

}  // namespace sle_agent::decision
