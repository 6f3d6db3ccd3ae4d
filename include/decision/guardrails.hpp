#pragma once

#include <string>

#include "api/device_api.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "model/remediation.hpp"

namespace sle_agent::decision {

[[nodiscard]] bool within_business_hours(int minutes_of_day, const core::BusinessHours& hours) noexcept;

// Checks, in order: business hours, client-count floor, uptime floor. The first
// failing check decides the result. A failure to read live state fails the
// evaluation with an "error: ..." reason.
class GuardrailEvaluator {
 public:
  GuardrailEvaluator(api::DeviceApi& api, const core::Clock& clock);

  model::guardrail_result evaluate(const std::string& ap_id, const core::GuardrailConfig& guardrails) const;

 private:
  api::DeviceApi& api_;
  const core::Clock& clock_;
};

}  // namespace sle_agent::decision
