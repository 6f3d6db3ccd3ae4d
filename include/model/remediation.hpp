#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace sle_agent::model {

// Lower score is more severe; enum order follows severity rank.
enum class severity : std::uint8_t {
  CRITICAL = 0,
  HIGH = 1,
  MEDIUM = 2,
  LOW = 3,
};

enum class remediation_action : std::uint8_t {
  REBOOT = 0,
  WLAN_RESET = 1,
  RRM_ADJUSTMENT = 2,
};

enum class remediation_status : std::uint8_t {
  PENDING = 0,
  SUCCESS = 1,
  BLOCKED = 2,
  ERROR = 3,
  NOT_IMPLEMENTED = 4,
};

enum class validation_status : std::uint8_t {
  RESTORED = 0,
  FAILED = 1,
};

enum class workflow_status : std::uint8_t {
  SUCCESS = 0,
  FAILED = 1,
  BLOCKED = 2,
  ERROR = 3,
  NOT_IMPLEMENTED = 4,
};

struct ap_stats {
  std::string status{"unknown"};
  std::int64_t uptime_s{0};
  std::int64_t num_clients{0};
  double cpu_util{0.0};
  double mem_util{0.0};
  std::string ip{"N/A"};
  std::string version{"N/A"};
};

struct ap_details {
  std::string model{"N/A"};
  std::string name{};
  nlohmann::json raw{};
};

struct ap_diagnostics {
  std::string timestamp{};
  std::string ap_id{};
  bool ok{false};
  std::string error{};
  ap_stats stats{};
  ap_details details{};
};

struct sle_issue {
  std::string sle_type{};
  double score{0.0};
  severity level{severity::LOW};
};

struct sle_diagnostics {
  std::string timestamp{};
  std::string sle_type{};
  bool ok{false};
  std::string error{};
  // Score of the requested sle_type; nullopt when the document does not carry it.
  std::optional<double> score{};
  std::vector<sle_issue> issues{};
};

struct guardrail_result {
  bool passed{false};
  std::string reason{};
};

struct remediation_attempt {
  std::string ap_id{};
  std::string action{};
  remediation_status status{remediation_status::PENDING};
  std::string reason{};
  nlohmann::json response{};
  std::string timestamp{};
  bool forced{false};
};

struct validation_attempt {
  std::uint32_t attempt_index{0};
  std::string timestamp{};
  double score{0.0};
  // false when the score could not be extracted and 0 was substituted.
  bool score_known{false};
  bool restored{false};
};

struct validation_result {
  validation_status status{validation_status::FAILED};
  std::string reason{};
  bool cancelled{false};
  bool ap_online{false};
  std::string ap_status{"unknown"};
  std::vector<validation_attempt> attempts{};
  double final_score{0.0};
  double duration_seconds{0.0};
};

struct remediation_advice {
  bool recommended{false};
  std::string reason{};
};

struct workflow_outcome {
  workflow_status status{workflow_status::ERROR};
  std::string ap_id{};
  std::string sle_type{};
  std::optional<double> current_score{};
  std::optional<severity> level{};
  std::string action{};
  remediation_advice advice{};
  ap_diagnostics diagnostics{};
  sle_diagnostics sle{};
  remediation_attempt remediation{};
  std::optional<validation_result> validation{};
  std::vector<std::string> recommendations{};
  bool remediation_needed{false};
  std::string ticket_priority{"normal"};
  std::string started_at{};
  double duration_seconds{0.0};
};

const char* to_string(severity value) noexcept;
const char* to_string(remediation_action value) noexcept;
const char* to_string(remediation_status value) noexcept;
const char* to_string(validation_status value) noexcept;
const char* to_string(workflow_status value) noexcept;

// Accepts "reboot", "wlan_reset", "rrm_adjustment" and the short alias "rrm".
std::optional<remediation_action> parse_action(std::string_view name) noexcept;

}  // namespace sle_agent::model
