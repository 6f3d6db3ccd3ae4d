#include "workflow/workflow.hpp"

#include <chrono>
#include <iostream>

#include "core/timestamp.hpp"
#include "decision/action_selector.hpp"
#include "decision/severity.hpp"
#include "diagnostics/diagnostics.hpp"

namespace sle_agent::workflow {

Workflow::Workflow(const core::RulesConfig& config, api::DeviceApi& api, const core::Clock& clock)
    : config_(config),
      guardrails_(api, clock),
      executor_(api, guardrails_, config.guardrails),
      validation_(api),
      api_(api) {}

model::workflow_outcome Workflow::run(const WorkflowRequest& request, core::CancellationToken& token) const {
  const auto started = std::chrono::steady_clock::now();

  model::workflow_outcome outcome{};
  outcome.ap_id = request.ap_id;
  outcome.sle_type = request.sle_type;
  outcome.started_at = core::iso8601_utc_now();

  std::cerr << "[workflow] start ap=" << request.ap_id << " sle=" << request.sle_type << '\n';

  outcome.diagnostics = diagnostics::collect_ap_diagnostics(api_, request.ap_id);
  outcome.sle = diagnostics::collect_sle_diagnostics(api_, request.sle_type, config_);

  outcome.current_score = outcome.sle.score;
  if (outcome.current_score.has_value()) {
    outcome.level = decision::classify(*outcome.current_score, config_.thresholds);
    const auto decision = decision::should_remediate(*outcome.current_score, config_.validation.threshold_score);
    outcome.advice = model::remediation_advice{decision.remediate, decision.reason};
    std::cerr << "[workflow] ap=" << request.ap_id << " score=" << *outcome.current_score
              << " severity=" << model::to_string(*outcome.level) << '\n';
  } else {
    outcome.advice = model::remediation_advice{false, "current SLE score unknown for " + request.sle_type};
    std::cerr << "[workflow] ap=" << request.ap_id << " score=unknown\n";
  }

  outcome.action = request.action_override.has_value()
                       ? *request.action_override
                       : decision::select_action(request.sle_type, config_.remediation_strategies);

  if (token.cancelled()) {
    outcome.remediation.ap_id = request.ap_id;
    outcome.remediation.action = outcome.action;
    outcome.remediation.status = model::remediation_status::ERROR;
    outcome.remediation.reason = "cancelled before remediation";
    outcome.remediation.timestamp = core::iso8601_utc_now();
  } else {
    outcome.remediation = executor_.execute(request.ap_id, outcome.action, request.force);
  }

  if (outcome.remediation.status == model::remediation_status::SUCCESS) {
    token.tighten_deadline_after(core::validation_budget(config_));
    outcome.validation = validation_.validate(request.ap_id, request.sle_type,
                                              validation::make_validation_settings(config_.validation), token);
  }

  outcome.recommendations = build_recommendations(outcome);
  outcome.remediation_needed = outcome.diagnostics.ok && outcome.sle.ok && !outcome.sle.issues.empty();
  outcome.ticket_priority = decision::ticket_priority(request.sle_type, outcome.level, config_.ticket_priority_map);
  outcome.status = resolve_status(outcome.remediation, outcome.validation);
  outcome.duration_seconds = core::seconds_since(started);

  std::cerr << "[workflow] done ap=" << request.ap_id << " status=" << model::to_string(outcome.status)
            << " duration=" << outcome.duration_seconds << "s\n";
  return outcome;
}

std::vector<std::string> Workflow::build_recommendations(const model::workflow_outcome& outcome) const {
  std::vector<std::string> recommendations;
  const auto& guardrails = config_.guardrails;

  if (!outcome.diagnostics.ok) {
    recommendations.push_back("AP diagnostics unavailable: " + outcome.diagnostics.error);
  } else {
    if (outcome.diagnostics.stats.num_clients < guardrails.min_clients) {
      recommendations.push_back("Low client count - remediation may have limited impact");
    }
    if (outcome.diagnostics.stats.uptime_s < guardrails.min_reboot_interval.count()) {
      recommendations.push_back("AP recently rebooted - allow stabilization time");
    }
  }

  if (!outcome.current_score.has_value()) {
    recommendations.push_back("SLE score for " + outcome.sle_type + " unknown - verify metric availability");
  }
  return recommendations;
}

model::workflow_status resolve_status(const model::remediation_attempt& remediation,
                                      const std::optional<model::validation_result>& validation) noexcept {
  switch (remediation.status) {
    case model::remediation_status::BLOCKED:
      return model::workflow_status::BLOCKED;
    case model::remediation_status::NOT_IMPLEMENTED:
      return model::workflow_status::NOT_IMPLEMENTED;
    case model::remediation_status::PENDING:
    case model::remediation_status::ERROR:
      return model::workflow_status::ERROR;
    case model::remediation_status::SUCCESS:
      break;
  }

  if (validation.has_value() && validation->status == model::validation_status::RESTORED) {
    return model::workflow_status::SUCCESS;
  }
  return model::workflow_status::FAILED;
}

}  // namespace sle_agent::workflow
