#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/errors.hpp"
#include "model/remediation.hpp"

namespace sle_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::chrono::seconds parse_seconds(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed < 0) {
    throw ConfigError(key + " must be greater than or equal to 0");
  }
  return std::chrono::seconds(parsed);
}

std::string normalize_key(const std::string& key) {
  if (key.rfind("sle_thresholds.", 0) == 0) {
    return "thresholds." + key.substr(std::string("sle_thresholds.").size());
  }
  if (key.rfind("zendesk.priority_map.", 0) == 0) {
    return "tickets.priority_map." + key.substr(std::string("zendesk.priority_map.").size());
  }
  return key;
}

void apply_strategy_key(RulesConfig& config, const std::string& key, const std::string& value) {
  // remediation_strategies.<sle_type>.<index>.<field>
  const std::string rest = key.substr(std::string("remediation_strategies.").size());
  const auto field_split = rest.rfind('.');
  if (field_split == std::string::npos) {
    throw ConfigError("remediation_strategies entries must be lists of {action, priority}: " + key);
  }
  const auto index_split = rest.rfind('.', field_split - 1);
  if (index_split == std::string::npos || field_split == 0) {
    throw ConfigError("remediation_strategies entries must be lists of {action, priority}: " + key);
  }

  const std::string sle_type = rest.substr(0, index_split);
  const auto index = static_cast<std::size_t>(std::stoul(rest.substr(index_split + 1, field_split - index_split - 1)));
  const std::string field = rest.substr(field_split + 1);

  auto& strategies = config.remediation_strategies[sle_type];
  if (strategies.size() <= index) {
    strategies.resize(index + 1);
  }

  if (field == "action") {
    strategies[index].action = value;
    return;
  }
  if (field == "priority") {
    strategies[index].priority = std::stoi(value);
    return;
  }
  std::cerr << "[config] ignoring unknown strategy field " << key << '\n';
}

void apply_redis_address(RedisAuditConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw ConfigError("audit.redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(RulesConfig& config, const std::string& key, const std::string& value) {
  if (key == "thresholds.critical") {
    config.thresholds.critical = std::stod(value);
    return;
  }
  if (key == "thresholds.high") {
    config.thresholds.high = std::stod(value);
    return;
  }
  if (key == "thresholds.medium") {
    config.thresholds.medium = std::stod(value);
    return;
  }
  if (key == "thresholds.low") {
    config.thresholds.low = std::stod(value);
    return;
  }

  if (key == "guardrails.min_clients") {
    config.guardrails.min_clients = std::stoll(value);
    return;
  }
  if (key == "guardrails.min_reboot_interval") {
    config.guardrails.min_reboot_interval = parse_seconds(key, value);
    return;
  }
  if (key == "guardrails.max_daily_reboots") {
    config.guardrails.max_daily_reboots = std::stoll(value);
    return;
  }
  if (key == "guardrails.business_hours_only") {
    config.guardrails.business_hours_only = parse_bool(value);
    return;
  }
  if (key == "guardrails.business_hours.start") {
    config.guardrails.business_hours.start_minute = parse_time_of_day(value);
    return;
  }
  if (key == "guardrails.business_hours.end") {
    config.guardrails.business_hours.end_minute = parse_time_of_day(value);
    return;
  }
  if (key == "guardrails.business_hours.timezone") {
    config.guardrails.business_hours.timezone = value;
    return;
  }

  if (key == "validation.poll_interval") {
    config.validation.poll_interval = parse_seconds(key, value);
    return;
  }
  if (key == "validation.max_attempts") {
    const auto attempts = std::stoll(value);
    if (attempts <= 0) {
      throw ConfigError("validation.max_attempts must be greater than 0");
    }
    config.validation.max_attempts = static_cast<std::uint32_t>(attempts);
    return;
  }
  if (key == "validation.timeout") {
    config.validation.timeout = parse_seconds(key, value);
    return;
  }
  if (key == "validation.threshold_score") {
    config.validation.threshold_score = std::stod(value);
    return;
  }
  if (key == "validation.stabilization_delay") {
    config.validation.stabilization_delay = parse_seconds(key, value);
    return;
  }

  if (key.rfind("remediation_strategies.", 0) == 0) {
    apply_strategy_key(config, key, value);
    return;
  }

  if (key.rfind("tickets.priority_map.", 0) == 0) {
    config.ticket_priority_map[key.substr(std::string("tickets.priority_map.").size())] = value;
    return;
  }

  if (key == "api.timeout") {
    config.api.timeout = parse_seconds(key, value);
    return;
  }

  if (key == "audit.redis.address") {
    apply_redis_address(config.audit, value);
    return;
  }
  if (key == "audit.redis.password") {
    config.audit.password = value;
    return;
  }
  if (key == "audit.redis.db") {
    config.audit.db = std::stoi(value);
    return;
  }
  if (key == "audit.redis.key_prefix") {
    config.audit.key_prefix = value;
    return;
  }

  std::cerr << "[config] ignoring unknown key " << key << '\n';
}

// One open mapping key or list item, keyed by the column it starts at.
struct Section {
  std::size_t column{0};
  std::string key{};
  bool list_item{false};
};

std::string join_sections(const std::vector<Section>& sections) {
  std::ostringstream full_key;
  for (const auto& section : sections) {
    full_key << section.key << '.';
  }
  return full_key.str();
}

}  // namespace

RulesConfig default_rules_config() { return RulesConfig{}; }

int parse_time_of_day(const std::string& value) {
  const auto colon = value.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 3 != value.size()) {
    throw ConfigError("time of day must be HH:MM: " + value);
  }
  int hours = 0;
  int minutes = 0;
  try {
    hours = std::stoi(value.substr(0, colon));
    minutes = std::stoi(value.substr(colon + 1));
  } catch (const std::logic_error&) {
    throw ConfigError("time of day must be HH:MM: " + value);
  }
  if (hours < 0 || hours > 24 || minutes < 0 || minutes > 59 || (hours == 24 && minutes != 0)) {
    throw ConfigError("time of day out of range: " + value);
  }
  return (hours * 60) + minutes;
}

std::string format_time_of_day(const int minutes) {
  char buffer[8]{};
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", minutes / 60, minutes % 60);
  return buffer;
}

void validate_rules_config(const RulesConfig& config) {
  const auto& t = config.thresholds;
  if (!(t.critical < t.high && t.high < t.medium && t.medium < t.low)) {
    throw ConfigError("thresholds must be strictly ordered critical < high < medium < low");
  }

  const auto& guardrails = config.guardrails;
  if (guardrails.min_clients < 0) {
    throw ConfigError("guardrails.min_clients must be greater than or equal to 0");
  }
  if (guardrails.max_daily_reboots < 0) {
    throw ConfigError("guardrails.max_daily_reboots must be greater than or equal to 0");
  }
  if (guardrails.business_hours_only) {
    if (guardrails.business_hours.timezone.empty()) {
      throw ConfigError("guardrails.business_hours.timezone must not be empty");
    }
    if (guardrails.business_hours.start_minute == guardrails.business_hours.end_minute) {
      throw ConfigError("guardrails.business_hours start and end must differ");
    }
  }

  const auto& validation = config.validation;
  if (validation.max_attempts == 0) {
    throw ConfigError("validation.max_attempts must be greater than 0");
  }
  if (validation.threshold_score < 0.0 || validation.threshold_score > 100.0) {
    throw ConfigError("validation.threshold_score must be in range 0..100");
  }
  const auto poll_schedule = validation.poll_interval * static_cast<std::int64_t>(validation.max_attempts - 1);
  if (validation.timeout < poll_schedule) {
    throw ConfigError("validation.timeout must cover (max_attempts - 1) * poll_interval (" +
                      std::to_string(poll_schedule.count()) + "s)");
  }

  for (const auto& [sle_type, strategies] : config.remediation_strategies) {
    for (const auto& strategy : strategies) {
      if (strategy.action.empty()) {
        throw ConfigError("remediation_strategies." + sle_type + " has an entry without an action");
      }
      if (!model::parse_action(strategy.action).has_value()) {
        throw ConfigError("remediation_strategies." + sle_type + " has unknown action " + strategy.action);
      }
    }
  }

  for (const auto& [level, priority] : config.ticket_priority_map) {
    if (priority != "urgent" && priority != "high" && priority != "normal" && priority != "low") {
      throw ConfigError("tickets.priority_map." + level + " must be one of urgent, high, normal, low");
    }
  }

  if (config.api.timeout.count() <= 0) {
    throw ConfigError("api.timeout must be greater than 0");
  }
}

RulesConfig load_rules_config(const std::string& path) {
  RulesConfig config = default_rules_config();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::cerr << "[config] rules file not found: " << path << ", using built-in defaults\n";
    return config;
  }

  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open rules file: " + path);
  }

  std::vector<Section> sections;
  std::unordered_map<std::string, std::size_t> list_counts;
  std::unordered_set<std::string> seen_keys;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t column = 0;
    while (column < line.size() && line[column] == ' ') {
      ++column;
    }
    std::string stripped = trim(line);

    // "- key: value" opens a new list item under the closest key at or left of
    // the dash, so both indented and indentless sequences attach to it.
    if (stripped == "-" || stripped.rfind("- ", 0) == 0) {
      while (!sections.empty() &&
             (sections.back().column > column || (sections.back().list_item && sections.back().column == column))) {
        sections.pop_back();
      }
      const std::string list_key = join_sections(sections);
      const std::size_t index = list_counts[list_key]++;
      sections.push_back(Section{column, std::to_string(index), true});

      std::size_t field_column = column + 1;
      while (field_column < line.size() && line[field_column] == ' ') {
        ++field_column;
      }
      column = field_column;
      stripped = trim(stripped.substr(1));
      if (stripped.empty()) {
        continue;
      }
    }

    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    while (!sections.empty() && sections.back().column >= column) {
      sections.pop_back();
    }

    if (value.empty()) {
      sections.push_back(Section{column, key, false});
      continue;
    }

    const std::string full_key = normalize_key(join_sections(sections) + key);
    seen_keys.insert(full_key);

    try {
      apply_key_value(config, full_key, value);
    } catch (const std::logic_error&) {
      throw ConfigError("invalid value for " + full_key + ": " + value);
    }
  }

  for (const char* required : {"thresholds.critical", "thresholds.high", "thresholds.medium", "thresholds.low"}) {
    if (seen_keys.find(required) == seen_keys.end()) {
      throw ConfigError(std::string("missing required key ") + required + " in " + path);
    }
  }

  validate_rules_config(config);
  return config;
}

std::chrono::seconds validation_budget(const RulesConfig& config) {
  return config.validation.stabilization_delay + config.validation.timeout;
}

}  // namespace sle_agent::core
