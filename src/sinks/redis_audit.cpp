#include "sinks/redis_audit.hpp"

#include "core/timestamp.hpp"
#include "report/json_report.hpp"

#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace sle_agent::sinks {
namespace {

constexpr const char* kEventsSuffix = "events";
constexpr std::size_t kMaxCommandArgCount = 1 + (3 * 3);

const std::vector<std::string>& metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = {
      "final_score",
      "mttr_seconds",
      "status",
  };
  return kMetricSuffixes;
}

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(sanitize_value(value)));
}

bool reply_error_contains(const redisReply* reply, const char* needle) {
  return reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, needle) != nullptr;
}

}  // namespace

RedisAuditSink::RedisAuditSink(core::RedisAuditConfig options, const std::uint32_t connect_timeout_ms)
    : options_(std::move(options)), connect_timeout_ms_(connect_timeout_ms) {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

RedisAuditSink::~RedisAuditSink() = default;

RedisAuditSink::RedisAuditSink(RedisAuditSink&&) noexcept = default;
RedisAuditSink& RedisAuditSink::operator=(RedisAuditSink&&) noexcept = default;

bool RedisAuditSink::check_connectivity() {
  return ensure_connected();
}

void RedisAuditSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisAuditSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisAuditSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(connect_timeout_ms_ / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((connect_timeout_ms_ % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db() || !ensure_schema()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisAuditSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisAuditSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisAuditSink::ensure_schema() {
  if (schema_ready_ || !timeseries_available_) {
    return true;
  }

  for (const auto& suffix : metric_suffixes()) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists = reply_error_contains(reply, "already exists");
    const bool unknown_command = reply_error_contains(reply, "unknown command");
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available; publishing audit stream only\n";
      timeseries_available_ = false;
      return true;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisAuditSink::publish(const model::workflow_outcome& outcome) {
  // XADD is not idempotent; a retry only resends the stages that failed.
  bool event_appended = false;
  bool ok = ensure_connected() && publish_impl(outcome, event_appended);
  if (!ok && context_ != nullptr) {
    ok = reconnect() && publish_impl(outcome, event_appended);
  }

  if (!ok) {
    if (was_ok_) {
      std::cerr << "[redis] audit publish failed\n";
      was_ok_ = false;
    }
  } else if (!was_ok_) {
    std::cerr << "[redis] audit publish recovered\n";
    was_ok_ = true;
  }
  return ok;
}

bool RedisAuditSink::publish_impl(const model::workflow_outcome& outcome, bool& event_appended) {
  if (!event_appended) {
    if (!append_event(outcome)) {
      return false;
    }
    event_appended = true;
  }
  if (!timeseries_available_) {
    return true;
  }
  return add_metrics(outcome);
}

bool RedisAuditSink::append_event(const model::workflow_outcome& outcome) {
  command_args_.clear();
  command_args_.emplace_back("XADD");
  command_args_.emplace_back(options_.key_prefix + ":" + kEventsSuffix);
  command_args_.emplace_back("*");
  command_args_.emplace_back("ap_id");
  command_args_.emplace_back(outcome.ap_id);
  command_args_.emplace_back("status");
  command_args_.emplace_back(model::to_string(outcome.status));
  command_args_.emplace_back("event");
  command_args_.emplace_back(report::serialize(report::to_json(outcome)));
  return run_command();
}

bool RedisAuditSink::add_metrics(const model::workflow_outcome& outcome) {
  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;

  command_args_.clear();
  command_args_.emplace_back("TS.MADD");
  if (outcome.validation.has_value()) {
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "final_score", outcome.validation->final_score);
  }
  add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "mttr_seconds", outcome.duration_seconds);
  add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "status",
                  static_cast<double>(static_cast<std::uint8_t>(outcome.status)));
  return run_command();
}

bool RedisAuditSink::run_command() {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] " << command_args_.front() << " rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace sle_agent::sinks
