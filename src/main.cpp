#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "api/device_api.hpp"
#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/credentials.hpp"
#include "core/errors.hpp"
#include "report/json_report.hpp"
#include "sinks/redis_audit.hpp"
#include "sinks/stdout_summary.hpp"
#include "workflow/workflow.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitNotSuccessful = 1;
constexpr int kExitConfigError = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

struct CliOptions {
  std::vector<std::string> ap_ids{};
  std::string sle_type{};
  std::string rules_path{"configs/sle_rules.yaml"};
  std::optional<std::string> action{};
  std::string output_path{"workflow.json"};
  bool force{false};
  bool skip_credential_check{false};
  bool help{false};
};

void print_usage(std::ostream& output) {
  output << "usage: sle-agent --ap <id> [--ap <id>...] --sle <type> [--rules path] [--action a]\n"
            "                 [--force] [--output path] [--skip-credential-check]\n";
}

CliOptions parse_cli(const int argc, char** argv) {
  CliOptions options{};
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto next_value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw sle_agent::core::ConfigError("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--ap") {
      options.ap_ids.push_back(next_value());
    } else if (arg == "--sle") {
      options.sle_type = next_value();
    } else if (arg == "--rules") {
      options.rules_path = next_value();
    } else if (arg == "--action") {
      options.action = next_value();
    } else if (arg == "--output") {
      options.output_path = next_value();
    } else if (arg == "--force") {
      options.force = true;
    } else if (arg == "--skip-credential-check") {
      options.skip_credential_check = true;
    } else if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else {
      throw sle_agent::core::ConfigError("unknown argument: " + arg);
    }
  }

  if (options.help) {
    return options;
  }
  if (options.ap_ids.empty()) {
    throw sle_agent::core::ConfigError("at least one --ap is required");
  }
  if (options.sle_type.empty()) {
    throw sle_agent::core::ConfigError("--sle is required");
  }
  if (options.action.has_value() && !sle_agent::model::parse_action(*options.action).has_value()) {
    throw sle_agent::core::ConfigError("unknown remediation action: " + *options.action);
  }
  return options;
}

}  // namespace

std::string format_config_settings(const sle_agent::core::RulesConfig& config, const std::string& rules_path) {
  const auto& guardrails = config.guardrails;
  const auto& validation = config.validation;

  std::ostringstream output;
  output << "[agent] loaded rules from " << rules_path << " | thresholds=" << config.thresholds.critical << '/'
         << config.thresholds.high << '/' << config.thresholds.medium << '/' << config.thresholds.low
         << " | min_clients=" << guardrails.min_clients
         << " | min_reboot_interval_s=" << guardrails.min_reboot_interval.count()
         << " | business_hours_only=" << (guardrails.business_hours_only ? "true" : "false")
         << " | validation_threshold=" << validation.threshold_score
         << " | poll_interval_s=" << validation.poll_interval.count()
         << " | max_attempts=" << validation.max_attempts
         << " | validation_budget_s=" << sle_agent::core::validation_budget(config).count()
         << " | redis_audit=";

  if (!config.audit.enabled) {
    output << "disabled";
  } else if (!config.audit.unix_socket.empty()) {
    output << "unix://" << config.audit.unix_socket;
  } else {
    output << config.audit.host << ':' << config.audit.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);

  CliOptions options{};
  sle_agent::core::RulesConfig config{};
  sle_agent::core::Credentials credentials{};
  try {
    options = parse_cli(argc, argv);
    if (options.help) {
      print_usage(std::cout);
      return kExitSuccess;
    }
    config = sle_agent::core::load_rules_config(options.rules_path);
    credentials = sle_agent::core::load_credentials_from_env();
  } catch (const sle_agent::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    print_usage(std::cerr);
    return kExitConfigError;
  }

  std::cerr << format_config_settings(config, options.rules_path) << '\n';

  auto api = sle_agent::api::make_mist_api(credentials, config.api.timeout);

  if (options.skip_credential_check) {
    std::cerr << "[agent] credential check skipped\n";
  } else {
    try {
      if (!api->validate_credentials()) {
        std::cerr << "credential error: API credentials rejected\n";
        return kExitConfigError;
      }
    } catch (const std::exception& ex) {
      std::cerr << "credential error: " << ex.what() << '\n';
      return kExitConfigError;
    }
  }

  std::unique_ptr<sle_agent::sinks::RedisAuditSink> audit_sink;
  if (config.audit.enabled) {
    audit_sink = std::make_unique<sle_agent::sinks::RedisAuditSink>(config.audit);
    const std::string address =
        config.audit.unix_socket.empty() ? config.audit.host + ':' + std::to_string(config.audit.port)
                                         : "unix://" + config.audit.unix_socket;
    if (audit_sink->check_connectivity()) {
      std::cerr << "[agent] audit redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[agent] audit redis connectivity check failed at " << address << '\n';
    }
  }

  std::unique_ptr<sle_agent::core::Clock> clock;
  try {
    clock = sle_agent::core::make_system_clock({config.guardrails.business_hours.timezone});
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return kExitConfigError;
  }
  const sle_agent::workflow::Workflow workflow{config, *api, *clock};

  const std::size_t target_count = options.ap_ids.size();
  std::vector<std::unique_ptr<sle_agent::core::CancellationToken>> tokens;
  std::vector<sle_agent::model::workflow_outcome> outcomes(target_count);
  std::vector<std::thread> workers;
  std::atomic<std::size_t> finished{0};
  tokens.reserve(target_count);
  workers.reserve(target_count);

  for (std::size_t i = 0; i < target_count; ++i) {
    tokens.push_back(std::make_unique<sle_agent::core::CancellationToken>());

    sle_agent::workflow::WorkflowRequest request{};
    request.ap_id = options.ap_ids[i];
    request.sle_type = options.sle_type;
    request.action_override = options.action;
    request.force = options.force;

    workers.emplace_back([&, i, request]() {
      try {
        outcomes[i] = workflow.run(request, *tokens[i]);
      } catch (const std::exception& ex) {
        auto& outcome = outcomes[i];
        outcome.status = sle_agent::model::workflow_status::ERROR;
        outcome.ap_id = request.ap_id;
        outcome.sle_type = request.sle_type;
        outcome.remediation.status = sle_agent::model::remediation_status::ERROR;
        outcome.remediation.reason = ex.what();
        std::cerr << "[agent] workflow for AP " << request.ap_id << " aborted: " << ex.what() << '\n';
      }
      finished.fetch_add(1);
    });
  }

  bool cancel_sent = false;
  while (finished.load() < target_count) {
    if (g_shutdown_requested != 0 && !cancel_sent) {
      std::cerr << "[agent] shutdown signal received; cancelling " << target_count << " workflow(s)\n";
      for (auto& token : tokens) {
        token->cancel();
      }
      cancel_sent = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  for (auto& worker : workers) {
    worker.join();
  }

  int exit_code = kExitSuccess;
  for (const auto& outcome : outcomes) {
    if (outcome.status != sle_agent::model::workflow_status::SUCCESS) {
      exit_code = kExitNotSuccessful;
    }
  }

  std::ofstream output(options.output_path);
  if (!output.is_open()) {
    std::cerr << "[agent] unable to write report to " << options.output_path << '\n';
    exit_code = kExitNotSuccessful;
  } else {
    output << sle_agent::report::serialize(sle_agent::report::to_json(outcomes), 2) << '\n';
    std::cerr << "[agent] report written to " << options.output_path << '\n';
  }

  const sle_agent::sinks::StdoutSummarySink stdout_sink{};
  for (const auto& outcome : outcomes) {
    stdout_sink.publish(outcome);
  }

  if (audit_sink != nullptr) {
    std::size_t undelivered = 0;
    for (const auto& outcome : outcomes) {
      if (!audit_sink->publish(outcome)) {
        ++undelivered;
      }
    }
    if (undelivered > 0) {
      std::cerr << "[agent] " << undelivered << " audit event(s) not delivered to redis\n";
    }
  }

  return exit_code;
}
