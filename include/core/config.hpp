#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sle_agent::core {

struct SeverityThresholds {
  double critical{60.0};
  double high{70.0};
  double medium{80.0};
  double low{90.0};
};

// Window is [start, end) in minutes since local midnight of `timezone`.
struct BusinessHours {
  int start_minute{8 * 60};
  int end_minute{18 * 60};
  std::string timezone{"UTC"};
};

struct GuardrailConfig {
  std::int64_t min_clients{3};
  std::chrono::seconds min_reboot_interval{1800};
  // Parsed and validated; not enforced without a reboot history store.
  std::int64_t max_daily_reboots{3};
  bool business_hours_only{false};
  BusinessHours business_hours{};
};

struct ValidationConfig {
  std::chrono::seconds poll_interval{60};
  std::uint32_t max_attempts{5};
  std::chrono::seconds timeout{300};
  double threshold_score{90.0};
  std::chrono::seconds stabilization_delay{60};
};

struct RemediationStrategy {
  std::string action{};
  int priority{99};
};

using StrategyMap = std::unordered_map<std::string, std::vector<RemediationStrategy>>;

struct ApiConfig {
  std::chrono::seconds timeout{30};
};

struct RedisAuditConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"sle:audit"};
  bool enabled{false};
};

struct RulesConfig {
  SeverityThresholds thresholds{};
  GuardrailConfig guardrails{};
  ValidationConfig validation{};
  StrategyMap remediation_strategies{};
  // severity name -> ticket priority (urgent, high, normal, low).
  std::unordered_map<std::string, std::string> ticket_priority_map{
      {"critical", "urgent"}, {"high", "high"}, {"medium", "normal"}, {"low", "low"}};
  ApiConfig api{};
  RedisAuditConfig audit{};
};

RulesConfig default_rules_config();

// Falls back to default_rules_config() when the file does not exist.
// Throws ConfigError for unreadable files, malformed values or a failed validation pass.
RulesConfig load_rules_config(const std::string& path);

void validate_rules_config(const RulesConfig& config);

// Parses "HH:MM" into minutes since midnight. Throws ConfigError.
int parse_time_of_day(const std::string& value);
std::string format_time_of_day(int minutes);

// Upper bound on one validation run: stabilization delay plus the polling timeout.
std::chrono::seconds validation_budget(const RulesConfig& config);

}  // namespace sle_agent::core
