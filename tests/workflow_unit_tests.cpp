#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "fakes/fake_device_api.hpp"
#include "model/remediation.hpp"
#include "report/json_report.hpp"
#include "workflow/workflow.hpp"

using sle_agent::core::CancellationToken;
using sle_agent::core::RemediationStrategy;
using sle_agent::core::RulesConfig;
using sle_agent::model::remediation_status;
using sle_agent::model::severity;
using sle_agent::model::validation_status;
using sle_agent::model::workflow_status;
using sle_agent::testing::FakeClock;
using sle_agent::testing::FakeDeviceApi;
using sle_agent::workflow::Workflow;
using sle_agent::workflow::WorkflowRequest;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool has_recommendation(const std::vector<std::string>& recommendations, const std::string& prefix) {
  for (const auto& recommendation : recommendations) {
    if (recommendation.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

RulesConfig fast_rules() {
  RulesConfig config{};
  config.validation.stabilization_delay = std::chrono::seconds(0);
  config.validation.poll_interval = std::chrono::seconds(0);
  config.validation.max_attempts = 3;
  config.validation.timeout = std::chrono::seconds(30);
  return config;
}

WorkflowRequest request_for(const std::string& sle_type) {
  WorkflowRequest request{};
  request.ap_id = "ap-1";
  request.sle_type = sle_type;
  return request;
}

int test_workflow_success_path() {
  FakeDeviceApi api;
  api.scores = {65.0, 92.0};
  FakeClock clock;
  const RulesConfig config = fast_rules();
  const Workflow workflow(config, api, clock);
  CancellationToken token;

  const auto outcome = workflow.run(request_for("throughput"), token);
  if (outcome.status != workflow_status::SUCCESS) {
    return fail("test_workflow_success_path", "expected success");
  }
  if (outcome.current_score != 65.0 || outcome.level != severity::HIGH || !outcome.advice.recommended) {
    return fail("test_workflow_success_path", "current score should be classified as high");
  }
  if (outcome.action != "reboot" || outcome.remediation.status != remediation_status::SUCCESS ||
      api.reboot_calls != 1) {
    return fail("test_workflow_success_path", "default reboot should be issued once");
  }
  if (!outcome.validation.has_value() || outcome.validation->status != validation_status::RESTORED ||
      outcome.validation->final_score != 92.0) {
    return fail("test_workflow_success_path", "validation should report the restored score");
  }
  if (!outcome.remediation_needed || !outcome.recommendations.empty()) {
    return fail("test_workflow_success_path", "healthy AP with low SLE needs remediation and no advisories");
  }
  if (outcome.ticket_priority != "high" || outcome.started_at.empty() || outcome.duration_seconds < 0.0) {
    return fail("test_workflow_success_path", "ticket priority and timing should be filled in");
  }
  if (!token.deadline().has_value()) {
    return fail("test_workflow_success_path", "validation budget should be applied as a deadline");
  }
  return 0;
}

int test_workflow_blocked_path() {
  FakeDeviceApi api;
  api.scores = {55.0};
  api.stats.num_clients = 1;
  api.stats.uptime_s = 300;
  FakeClock clock;
  const RulesConfig config = fast_rules();
  const Workflow workflow(config, api, clock);
  CancellationToken token;

  const auto outcome = workflow.run(request_for("throughput"), token);
  if (outcome.status != workflow_status::BLOCKED || outcome.remediation.status != remediation_status::BLOCKED) {
    return fail("test_workflow_blocked_path", "expected blocked");
  }
  if (api.reboot_calls != 0 || outcome.validation.has_value() || api.metrics_calls != 1) {
    return fail("test_workflow_blocked_path", "blocked run should neither reboot nor validate");
  }
  if (!has_recommendation(outcome.recommendations, "Low client count") ||
      !has_recommendation(outcome.recommendations, "AP recently rebooted")) {
    return fail("test_workflow_blocked_path", "both advisories should be present");
  }
  if (outcome.level != severity::CRITICAL || outcome.ticket_priority != "urgent") {
    return fail("test_workflow_blocked_path", "score 55 should be critical / urgent");
  }
  return 0;
}

int test_workflow_not_implemented_action() {
  FakeDeviceApi api;
  api.sle_type = "successful-connects";
  api.scores = {65.0};
  FakeClock clock;
  RulesConfig config = fast_rules();
  config.remediation_strategies["successful-connects"] = {RemediationStrategy{"wlan_reset", 1},
                                                          RemediationStrategy{"reboot", 2}};
  const Workflow workflow(config, api, clock);
  CancellationToken token;

  const auto outcome = workflow.run(request_for("successful-connects"), token);
  if (outcome.status != workflow_status::NOT_IMPLEMENTED || outcome.action != "wlan_reset") {
    return fail("test_workflow_not_implemented_action", "configured wlan_reset should be not_implemented");
  }
  if (outcome.validation.has_value() || api.reboot_calls != 0) {
    return fail("test_workflow_not_implemented_action", "not_implemented must not be validated");
  }

  WorkflowRequest overridden = request_for("successful-connects");
  overridden.action_override = "reboot";
  const auto forced_reboot = workflow.run(overridden, token);
  if (forced_reboot.action != "reboot" || api.reboot_calls != 1) {
    return fail("test_workflow_not_implemented_action", "explicit action should override the selector");
  }
  return 0;
}

int test_workflow_validation_failure() {
  FakeDeviceApi api;
  api.scores = {50.0};
  FakeClock clock;
  const RulesConfig config = fast_rules();
  const Workflow workflow(config, api, clock);
  CancellationToken token;

  const auto outcome = workflow.run(request_for("throughput"), token);
  if (outcome.status != workflow_status::FAILED) {
    return fail("test_workflow_validation_failure", "unrestored SLE should fail the workflow");
  }
  if (!outcome.validation.has_value() || outcome.validation->attempts.size() != 3 || api.metrics_calls != 4) {
    return fail("test_workflow_validation_failure", "expected one diagnostic fetch and three validation polls");
  }
  return 0;
}

int test_workflow_diagnostics_failure_and_unknown_score() {
  FakeDeviceApi api;
  api.details_error = true;
  api.scores = {70.0};
  FakeClock clock;
  const RulesConfig config = fast_rules();
  const Workflow workflow(config, api, clock);
  CancellationToken token;

  WorkflowRequest request = request_for("roaming");
  request.action_override = "rrm";
  const auto outcome = workflow.run(request, token);

  if (outcome.diagnostics.ok || outcome.remediation_needed) {
    return fail("test_workflow_diagnostics_failure_and_unknown_score", "failed snapshot cannot need remediation");
  }
  if (!has_recommendation(outcome.recommendations, "AP diagnostics unavailable")) {
    return fail("test_workflow_diagnostics_failure_and_unknown_score", "diagnostics failure should be advised");
  }
  if (outcome.current_score.has_value() || outcome.level.has_value() ||
      !has_recommendation(outcome.recommendations, "SLE score for roaming unknown")) {
    return fail("test_workflow_diagnostics_failure_and_unknown_score", "unknown SLE type should leave score unknown");
  }
  if (outcome.ticket_priority != "normal") {
    return fail("test_workflow_diagnostics_failure_and_unknown_score", "unknown severity maps to normal");
  }
  return 0;
}

int test_workflow_cancelled_before_remediation() {
  FakeDeviceApi api;
  api.scores = {40.0};
  FakeClock clock;
  const RulesConfig config = fast_rules();
  const Workflow workflow(config, api, clock);
  CancellationToken token;
  token.cancel();

  const auto outcome = workflow.run(request_for("throughput"), token);
  if (outcome.status != workflow_status::ERROR || api.reboot_calls != 0) {
    return fail("test_workflow_cancelled_before_remediation", "cancelled run must not reboot");
  }
  if (outcome.remediation.reason.find("cancelled") == std::string::npos) {
    return fail("test_workflow_cancelled_before_remediation", "reason should say cancelled");
  }
  return 0;
}

int test_resolve_status_table() {
  using sle_agent::workflow::resolve_status;

  sle_agent::model::remediation_attempt attempt{};
  attempt.status = remediation_status::SUCCESS;
  sle_agent::model::validation_result restored{};
  restored.status = validation_status::RESTORED;
  sle_agent::model::validation_result failed{};

  if (resolve_status(attempt, restored) != workflow_status::SUCCESS ||
      resolve_status(attempt, failed) != workflow_status::FAILED ||
      resolve_status(attempt, std::nullopt) != workflow_status::FAILED) {
    return fail("test_resolve_status_table", "success needs a restored validation");
  }
  attempt.status = remediation_status::ERROR;
  if (resolve_status(attempt, std::nullopt) != workflow_status::ERROR) {
    return fail("test_resolve_status_table", "error should mirror the remediation");
  }
  attempt.status = remediation_status::NOT_IMPLEMENTED;
  if (resolve_status(attempt, std::nullopt) != workflow_status::NOT_IMPLEMENTED) {
    return fail("test_resolve_status_table", "not_implemented should never be success");
  }
  return 0;
}

int test_json_report_fields() {
  FakeDeviceApi api;
  api.scores = {55.0};
  api.stats.num_clients = 0;
  FakeClock clock;
  const RulesConfig config = fast_rules();
  const Workflow workflow(config, api, clock);
  CancellationToken token;

  const auto blocked = workflow.run(request_for("throughput"), token);
  const nlohmann::json document = sle_agent::report::to_json(blocked);

  if (document.at("status") != "blocked" || document.at("ap_id") != "ap-1" || document.at("sle_type") != "throughput") {
    return fail("test_json_report_fields", "top-level identity fields missing");
  }
  if (!document.at("validation").is_null() || document.at("remediation").at("status") != "blocked") {
    return fail("test_json_report_fields", "blocked run should serialize validation as null");
  }
  if (!document.at("recommendations").is_array() || !document.at("remediation_needed").is_boolean()) {
    return fail("test_json_report_fields", "recommendations and remediation_needed should be typed");
  }
  if (document.at("severity") != "critical" || document.at("diagnostics").at("key_metrics").at("model") != "AP43") {
    return fail("test_json_report_fields", "severity and diagnostics snapshot should be serialized");
  }

  api.stats.num_clients = 12;
  api.scores = {55.0, 95.0};
  api.metrics_calls = 0;
  const auto succeeded = workflow.run(request_for("throughput"), token);
  const nlohmann::json success_document = sle_agent::report::to_json(succeeded);
  const auto& validation = success_document.at("validation");
  if (validation.at("overall_status") != "restored" || validation.at("attempts").size() != 1 ||
      validation.at("attempts").at(0).at("score") != 95.0) {
    return fail("test_json_report_fields", "validation attempts should be serialized");
  }

  const auto batch = sle_agent::report::to_json(std::vector<sle_agent::model::workflow_outcome>{blocked, succeeded});
  if (!batch.is_array() || batch.size() != 2) {
    return fail("test_json_report_fields", "several outcomes should serialize as an array");
  }
  const auto single = sle_agent::report::to_json(std::vector<sle_agent::model::workflow_outcome>{succeeded});
  if (!single.is_object()) {
    return fail("test_json_report_fields", "a single outcome should serialize as an object");
  }

  const auto summary = sle_agent::report::summary_json(succeeded);
  if (summary.at("status") != "success" || !summary.contains("mttr_seconds") || summary.at("final_score") != 95.0) {
    return fail("test_json_report_fields", "summary should carry status, MTTR and final score");
  }
  return 0;
}

int test_report_tolerates_invalid_utf8() {
  sle_agent::model::workflow_outcome outcome{};
  outcome.ap_id = "ap-\xff";
  outcome.sle_type = "throughput";
  outcome.diagnostics.ok = false;
  outcome.diagnostics.error = "malformed JSON from /devices/ap-1: name \"caf\xe9\"";
  outcome.remediation.status = remediation_status::ERROR;
  outcome.remediation.reason = "HTTP 500: caf\xe9";

  std::string text;
  std::string summary_text;
  try {
    text = sle_agent::report::serialize(
        sle_agent::report::to_json(std::vector<sle_agent::model::workflow_outcome>{outcome}), 2);
    summary_text = sle_agent::report::serialize(sle_agent::report::summary_json(outcome));
  } catch (const nlohmann::json::exception& ex) {
    std::cerr << ex.what() << '\n';
    return fail("test_report_tolerates_invalid_utf8", "serialization should not throw on Latin-1 text");
  }

  const auto document = nlohmann::json::parse(text);
  const std::string error = document.at("diagnostics").at("error").get<std::string>();
  if (error.find("caf\xEF\xBF\xBD") == std::string::npos || document.at("status") != "error") {
    return fail("test_report_tolerates_invalid_utf8", "invalid bytes should become replacement characters");
  }
  if (nlohmann::json::parse(summary_text).at("reason") != "HTTP 500: caf\xEF\xBF\xBD") {
    return fail("test_report_tolerates_invalid_utf8", "summary reason should be sanitized too");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_workflow_success_path(); rc != 0) return rc;
  if (int rc = test_workflow_blocked_path(); rc != 0) return rc;
  if (int rc = test_workflow_not_implemented_action(); rc != 0) return rc;
  if (int rc = test_workflow_validation_failure(); rc != 0) return rc;
  if (int rc = test_workflow_diagnostics_failure_and_unknown_score(); rc != 0) return rc;
  if (int rc = test_workflow_cancelled_before_remediation(); rc != 0) return rc;
  if (int rc = test_resolve_status_table(); rc != 0) return rc;
  if (int rc = test_json_report_fields(); rc != 0) return rc;
  if (int rc = test_report_tolerates_invalid_utf8(); rc != 0) return rc;

  std::cout << "[PASS] workflow unit tests\n";
  return 0;
}
