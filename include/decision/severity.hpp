#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "core/config.hpp"
#include "model/remediation.hpp"

namespace sle_agent::decision {

// Total over doubles: NaN is treated as the worst case (critical).
model::severity classify(double score, const core::SeverityThresholds& thresholds) noexcept;

struct RemediationDecision {
  bool remediate{false};
  std::string reason{};
};

// score >= threshold is healthy and never remediated.
RemediationDecision should_remediate(double score, double threshold);

// Maps severity through priority_map (default "normal"). Infrastructure SLEs
// (gateway-availability, dhcp-performance) are raised to at least "high".
std::string ticket_priority(const std::string& sle_type, std::optional<model::severity> level,
                            const std::unordered_map<std::string, std::string>& priority_map);

}  // namespace sle_agent::decision
