#pragma once

#include <optional>
#include <string>
#include <vector>

#include "api/device_api.hpp"
#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "decision/guardrails.hpp"
#include "model/remediation.hpp"
#include "remediation/executor.hpp"
#include "validation/validation_loop.hpp"

namespace sle_agent::workflow {

struct WorkflowRequest {
  std::string ap_id{};
  std::string sle_type{};
  // Skips the action selector when set.
  std::optional<std::string> action_override{};
  bool force{false};
};

// One linear remediation run per (ap_id, sle_type):
// diagnostics -> severity -> action -> guarded execution -> validation -> report.
// Always terminates with a structured outcome.
class Workflow {
 public:
  Workflow(const core::RulesConfig& config, api::DeviceApi& api, const core::Clock& clock);

  model::workflow_outcome run(const WorkflowRequest& request, core::CancellationToken& token) const;

 private:
  [[nodiscard]] std::vector<std::string> build_recommendations(const model::workflow_outcome& outcome) const;

  const core::RulesConfig& config_;
  decision::GuardrailEvaluator guardrails_;
  remediation::RemediationExecutor executor_;
  validation::ValidationLoop validation_;
  api::DeviceApi& api_;
};

model::workflow_status resolve_status(const model::remediation_attempt& remediation,
                                      const std::optional<model::validation_result>& validation) noexcept;

}  // namespace sle_agent::workflow
