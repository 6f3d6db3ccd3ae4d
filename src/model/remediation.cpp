#include "model/remediation.hpp"

namespace sle_agent::model {

const char* to_string(const severity value) noexcept {
  switch (value) {
    case severity::CRITICAL:
      return "critical";
    case severity::HIGH:
      return "high";
    case severity::MEDIUM:
      return "medium";
    case severity::LOW:
      return "low";
  }
  return "unknown";
}

const char* to_string(const remediation_action value) noexcept {
  switch (value) {
    case remediation_action::REBOOT:
      return "reboot";
    case remediation_action::WLAN_RESET:
      return "wlan_reset";
    case remediation_action::RRM_ADJUSTMENT:
      return "rrm_adjustment";
  }
  return "unknown";
}

const char* to_string(const remediation_status value) noexcept {
  switch (value) {
    case remediation_status::PENDING:
      return "pending";
    case remediation_status::SUCCESS:
      return "success";
    case remediation_status::BLOCKED:
      return "blocked";
    case remediation_status::ERROR:
      return "error";
    case remediation_status::NOT_IMPLEMENTED:
      return "not_implemented";
  }
  return "unknown";
}

const char* to_string(const validation_status value) noexcept {
  switch (value) {
    case validation_status::RESTORED:
      return "restored";
    case validation_status::FAILED:
      return "failed";
  }
  return "unknown";
}

const char* to_string(const workflow_status value) noexcept {
  switch (value) {
    case workflow_status::SUCCESS:
      return "success";
    case workflow_status::FAILED:
      return "failed";
    case workflow_status::BLOCKED:
      return "blocked";
    case workflow_status::ERROR:
      return "error";
    case workflow_status::NOT_IMPLEMENTED:
      return "not_implemented";
  }
  return "unknown";
}

std::optional<remediation_action> parse_action(const std::string_view name) noexcept {
  if (name == "reboot") {
    return remediation_action::REBOOT;
  }
  if (name == "wlan_reset") {
    return remediation_action::WLAN_RESET;
  }
  if (name == "rrm_adjustment" || name == "rrm") {
    return remediation_action::RRM_ADJUSTMENT;
  }
  return std::nullopt;
}

}  // namespace sle_agent::model
