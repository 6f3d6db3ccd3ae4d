#pragma once

#include <string>

#include "api/device_api.hpp"
#include "core/config.hpp"
#include "decision/guardrails.hpp"
#include "model/remediation.hpp"

namespace sle_agent::remediation {

// Runs one remediation action. State machine:
//   pending -> blocked          guardrails failed (not forced), device untouched
//   pending -> success          action call returned
//   pending -> error            transport failure or unknown action
//   pending -> not_implemented  wlan_reset / rrm_adjustment
// Issues at most one mutating call and never retries it.
class RemediationExecutor {
 public:
  RemediationExecutor(api::DeviceApi& api, const decision::GuardrailEvaluator& guardrails,
                      const core::GuardrailConfig& config);

  model::remediation_attempt execute(const std::string& ap_id, const std::string& action, bool force) const;

 private:
  void execute_reboot(model::remediation_attempt& attempt, bool force) const;

  api::DeviceApi& api_;
  const decision::GuardrailEvaluator& guardrails_;
  const core::GuardrailConfig& config_;
};

}  // namespace sle_agent::remediation
