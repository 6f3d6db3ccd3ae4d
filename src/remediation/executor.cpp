#include "remediation/executor.hpp"

#include <exception>
#include <iostream>

#include "core/timestamp.hpp"

namespace sle_agent::remediation {

RemediationExecutor::RemediationExecutor(api::DeviceApi& api, const decision::GuardrailEvaluator& guardrails,
                                         const core::GuardrailConfig& config)
    : api_(api), guardrails_(guardrails), config_(config) {}

model::remediation_attempt RemediationExecutor::execute(const std::string& ap_id, const std::string& action,
                                                        const bool force) const {
  model::remediation_attempt attempt{};
  attempt.ap_id = ap_id;
  attempt.action = action;
  attempt.timestamp = core::iso8601_utc_now();
  attempt.forced = force;

  const auto parsed = model::parse_action(action);
  if (!parsed.has_value()) {
    attempt.status = model::remediation_status::ERROR;
    attempt.reason = "unknown remediation action: " + action;
    std::cerr << "[remediation] " << attempt.reason << '\n';
    return attempt;
  }
  attempt.action = model::to_string(*parsed);

  switch (*parsed) {
    case model::remediation_action::REBOOT:
      execute_reboot(attempt, force);
      break;

    case model::remediation_action::WLAN_RESET:
      attempt.status = model::remediation_status::NOT_IMPLEMENTED;
      attempt.reason = "WLAN reset functionality pending implementation";
      std::cerr << "[remediation] WLAN reset requested for AP " << ap_id << " but not implemented\n";
      break;

    case model::remediation_action::RRM_ADJUSTMENT:
      attempt.status = model::remediation_status::NOT_IMPLEMENTED;
      attempt.reason = "RRM adjustment functionality pending implementation";
      std::cerr << "[remediation] RRM adjustment requested for AP " << ap_id << " but not implemented\n";
      break;
  }

  return attempt;
}

void RemediationExecutor::execute_reboot(model::remediation_attempt& attempt, const bool force) const {
  if (force) {
    std::cerr << "[remediation] force enabled; guardrails skipped for AP " << attempt.ap_id << '\n';
  } else {
    const auto guardrail = guardrails_.evaluate(attempt.ap_id, config_);
    if (!guardrail.passed) {
      attempt.status = model::remediation_status::BLOCKED;
      attempt.reason = guardrail.reason;
      return;
    }
  }

  try {
    attempt.response = api_.reboot_ap(attempt.ap_id);
    attempt.status = model::remediation_status::SUCCESS;
    attempt.reason = "reboot command issued for AP " + attempt.ap_id;
    std::cerr << "[remediation] " << attempt.reason << '\n';
  } catch (const std::exception& ex) {
    attempt.status = model::remediation_status::ERROR;
    attempt.reason = ex.what();
    std::cerr << "[remediation] reboot failed for AP " << attempt.ap_id << ": " << ex.what() << '\n';
  }
}

}  // namespace sle_agent::remediation
