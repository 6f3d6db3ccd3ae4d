#include "report/json_report.hpp"

namespace sle_agent::report {
namespace {

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return nlohmann::json(*value);
}

}  // namespace

std::string serialize(const nlohmann::json& document, const int indent) {
  return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json to_json(const model::remediation_attempt& attempt) {
  return nlohmann::json{{"ap_id", attempt.ap_id},
                        {"action", attempt.action},
                        {"status", model::to_string(attempt.status)},
                        {"reason", attempt.reason},
                        {"response", attempt.response},
                        {"timestamp", attempt.timestamp},
                        {"forced", attempt.forced}};
}

nlohmann::json to_json(const model::validation_result& result) {
  nlohmann::json attempts = nlohmann::json::array();
  for (const auto& attempt : result.attempts) {
    attempts.push_back({{"attempt", attempt.attempt_index},
                        {"timestamp", attempt.timestamp},
                        {"score", attempt.score_known ? nlohmann::json(attempt.score) : nlohmann::json("unknown")},
                        {"restored", attempt.restored}});
  }

  return nlohmann::json{{"overall_status", model::to_string(result.status)},
                        {"reason", result.reason},
                        {"cancelled", result.cancelled},
                        {"ap_online", result.ap_online},
                        {"ap_status", result.ap_status},
                        {"attempts", attempts},
                        {"final_score", result.final_score},
                        {"duration_seconds", result.duration_seconds}};
}

nlohmann::json to_json(const model::ap_diagnostics& diagnostics) {
  nlohmann::json document{{"timestamp", diagnostics.timestamp},
                          {"ap_id", diagnostics.ap_id},
                          {"status", diagnostics.ok ? "success" : "error"}};
  if (!diagnostics.ok) {
    document["error"] = diagnostics.error;
    return document;
  }

  const auto& stats = diagnostics.stats;
  document["key_metrics"] = {{"status", stats.status},       {"uptime", stats.uptime_s},
                             {"clients", stats.num_clients}, {"cpu_util", stats.cpu_util},
                             {"mem_util", stats.mem_util},   {"ip", stats.ip},
                             {"model", diagnostics.details.model}, {"version", stats.version}};
  if (!diagnostics.details.name.empty()) {
    document["name"] = diagnostics.details.name;
  }
  return document;
}

nlohmann::json to_json(const model::sle_diagnostics& diagnostics) {
  nlohmann::json issues = nlohmann::json::array();
  for (const auto& issue : diagnostics.issues) {
    issues.push_back(
        {{"metric", issue.sle_type}, {"score", issue.score}, {"severity", model::to_string(issue.level)}});
  }

  nlohmann::json document{{"timestamp", diagnostics.timestamp},
                          {"sle_type", diagnostics.sle_type},
                          {"status", diagnostics.ok ? "success" : "error"},
                          {"score", optional_value(diagnostics.score)},
                          {"issues", issues},
                          {"issue_count", diagnostics.issues.size()}};
  if (!diagnostics.ok) {
    document["error"] = diagnostics.error;
  }
  return document;
}

nlohmann::json to_json(const model::workflow_outcome& outcome) {
  const nlohmann::json level =
      outcome.level.has_value() ? nlohmann::json(model::to_string(*outcome.level)) : nlohmann::json("unknown");
  nlohmann::json document{
      {"status", model::to_string(outcome.status)},
      {"ap_id", outcome.ap_id},
      {"sle_type", outcome.sle_type},
      {"current_score", optional_value(outcome.current_score)},
      {"severity", level},
      {"action", outcome.action},
      {"remediation_advice", {{"recommended", outcome.advice.recommended}, {"reason", outcome.advice.reason}}},
      {"diagnostics", to_json(outcome.diagnostics)},
      {"sle_diagnostics", to_json(outcome.sle)},
      {"remediation", to_json(outcome.remediation)},
      {"validation", outcome.validation.has_value() ? to_json(*outcome.validation) : nlohmann::json(nullptr)},
      {"recommendations", outcome.recommendations},
      {"remediation_needed", outcome.remediation_needed},
      {"ticket_priority", outcome.ticket_priority},
      {"started_at", outcome.started_at},
      {"duration_seconds", outcome.duration_seconds}};
  return document;
}

nlohmann::json to_json(const std::vector<model::workflow_outcome>& outcomes) {
  if (outcomes.size() == 1) {
    return to_json(outcomes.front());
  }
  nlohmann::json documents = nlohmann::json::array();
  for (const auto& outcome : outcomes) {
    documents.push_back(to_json(outcome));
  }
  return documents;
}

nlohmann::json summary_json(const model::workflow_outcome& outcome) {
  nlohmann::json summary{{"ap_id", outcome.ap_id},
                         {"sle_type", outcome.sle_type},
                         {"status", model::to_string(outcome.status)},
                         {"action", outcome.action},
                         {"remediation", model::to_string(outcome.remediation.status)},
                         {"reason", outcome.remediation.reason},
                         {"ticket_priority", outcome.ticket_priority},
                         {"mttr_seconds", outcome.duration_seconds}};
  if (outcome.validation.has_value()) {
    summary["validation"] = model::to_string(outcome.validation->status);
    summary["final_score"] = outcome.validation->final_score;
  }
  return summary;
}

}  // namespace sle_agent::report
