#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "model/remediation.hpp"
#include "sinks/redis_audit.hpp"

using sle_agent::core::RedisAuditConfig;
using sle_agent::model::workflow_outcome;
using sle_agent::model::workflow_status;
using sle_agent::sinks::RedisAuditSink;

namespace {

struct RedisMockState {
  std::vector<std::vector<std::string>> argv_calls{};
  std::vector<std::string> commands{};
  int connect_calls{0};
  bool connect_fails{false};
  bool timeseries_missing{false};
  int madd_failures{0};
};

RedisMockState g_redis_mock{};

char g_unknown_command[] = "ERR unknown command 'TS.CREATE'";
char g_connection_refused[] = "Connection refused";
char g_madd_rejected[] = "ERR TSDB: connection reset";

redisContext* make_context() {
  g_redis_mock.connect_calls += 1;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  if (g_redis_mock.connect_fails) {
    context->err = REDIS_ERR_IO;
    std::strncpy(context->errstr, g_connection_refused, sizeof(context->errstr) - 1);
  } else {
    context->err = REDIS_OK;
  }
  return context;
}

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) { return make_context(); }

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) { return make_context(); }

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  g_redis_mock.commands.emplace_back(format);
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  if (g_redis_mock.timeseries_missing && std::strncmp(format, "TS.CREATE", 9) == 0) {
    reply->type = REDIS_REPLY_ERROR;
    reply->str = g_unknown_command;
    return reply;
  }
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  std::vector<std::string> call;
  for (int i = 0; i < argc; ++i) {
    call.emplace_back(argv[i], argvlen[i]);
  }
  g_redis_mock.argv_calls.push_back(call);
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  if (call.front() == "TS.MADD" && g_redis_mock.madd_failures > 0) {
    g_redis_mock.madd_failures -= 1;
    reply->type = REDIS_REPLY_ERROR;
    reply->str = g_madd_rejected;
    return reply;
  }
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

workflow_outcome sample_outcome() {
  workflow_outcome outcome{};
  outcome.status = workflow_status::SUCCESS;
  outcome.ap_id = "ap-7";
  outcome.sle_type = "throughput";
  outcome.action = "reboot";
  outcome.duration_seconds = 184.5;
  sle_agent::model::validation_result validation{};
  validation.status = sle_agent::model::validation_status::RESTORED;
  validation.final_score = 93.0;
  outcome.validation = validation;
  return outcome;
}

RedisAuditConfig audit_options() {
  RedisAuditConfig options{};
  options.enabled = true;
  options.key_prefix = "site1:audit";
  return options;
}

int test_audit_publishes_stream_and_metrics() {
  g_redis_mock = {};
  RedisAuditSink sink(audit_options());

  if (!sink.publish(sample_outcome())) {
    return fail("test_audit_publishes_stream_and_metrics", "publish should succeed with mock redis");
  }
  if (g_redis_mock.commands.size() != 3) {
    return fail("test_audit_publishes_stream_and_metrics", "expected one TS.CREATE per metric");
  }
  if (g_redis_mock.argv_calls.size() != 2) {
    return fail("test_audit_publishes_stream_and_metrics", "expected XADD followed by TS.MADD");
  }

  const auto& xadd = g_redis_mock.argv_calls[0];
  if (xadd.size() != 9 || xadd[0] != "XADD" || xadd[1] != "site1:audit:events" || xadd[2] != "*") {
    return fail("test_audit_publishes_stream_and_metrics", "XADD should target the events stream");
  }
  const auto event = nlohmann::json::parse(xadd[8]);
  if (event.at("ap_id") != "ap-7" || event.at("status") != "success" || xadd[6] != "success") {
    return fail("test_audit_publishes_stream_and_metrics", "event payload should be the outcome report");
  }

  const auto& madd = g_redis_mock.argv_calls[1];
  if (madd.size() != 10 || madd[0] != "TS.MADD" || madd[1] != "site1:audit:final_score" ||
      madd[4] != "site1:audit:mttr_seconds" || madd[7] != "site1:audit:status") {
    return fail("test_audit_publishes_stream_and_metrics", "TS.MADD should carry score, MTTR and status");
  }
  if (std::stod(madd[3]) != 93.0 || std::stod(madd[6]) != 184.5 || std::stod(madd[9]) != 0.0) {
    return fail("test_audit_publishes_stream_and_metrics", "metric values mismatch");
  }
  return 0;
}

int test_audit_skips_final_score_without_validation() {
  g_redis_mock = {};
  RedisAuditSink sink(audit_options());

  auto outcome = sample_outcome();
  outcome.status = workflow_status::BLOCKED;
  outcome.validation.reset();
  if (!sink.publish(outcome)) {
    return fail("test_audit_skips_final_score_without_validation", "publish should succeed");
  }

  const auto& madd = g_redis_mock.argv_calls.back();
  if (madd.size() != 7 || madd[1] != "site1:audit:mttr_seconds") {
    return fail("test_audit_skips_final_score_without_validation", "final_score should be omitted");
  }
  if (std::stod(madd[6]) != 2.0) {
    return fail("test_audit_skips_final_score_without_validation", "blocked status should encode as 2");
  }
  return 0;
}

int test_audit_without_timeseries_module() {
  g_redis_mock = {};
  g_redis_mock.timeseries_missing = true;
  RedisAuditSink sink(audit_options());

  if (!sink.publish(sample_outcome())) {
    return fail("test_audit_without_timeseries_module", "stream audit should work without RedisTimeSeries");
  }
  if (g_redis_mock.argv_calls.size() != 1 || g_redis_mock.argv_calls[0][0] != "XADD") {
    return fail("test_audit_without_timeseries_module", "only XADD should be sent");
  }
  if (g_redis_mock.commands.size() != 1) {
    return fail("test_audit_without_timeseries_module", "schema probing should stop at the first unknown command");
  }
  return 0;
}

int test_audit_connect_failure_and_recovery() {
  g_redis_mock = {};
  g_redis_mock.connect_fails = true;
  RedisAuditSink sink(audit_options());

  if (sink.publish(sample_outcome())) {
    return fail("test_audit_connect_failure_and_recovery", "publish should fail while redis is down");
  }
  if (!g_redis_mock.argv_calls.empty()) {
    return fail("test_audit_connect_failure_and_recovery", "no commands should be sent without a connection");
  }

  g_redis_mock.connect_fails = false;
  if (!sink.check_connectivity() || !sink.publish(sample_outcome())) {
    return fail("test_audit_connect_failure_and_recovery", "sink should reconnect once redis is back");
  }
  if (g_redis_mock.argv_calls.size() != 2) {
    return fail("test_audit_connect_failure_and_recovery", "recovered publish should send XADD and TS.MADD");
  }
  return 0;
}

int test_audit_retry_does_not_duplicate_event() {
  g_redis_mock = {};
  g_redis_mock.madd_failures = 1;
  RedisAuditSink sink(audit_options());

  if (!sink.publish(sample_outcome())) {
    return fail("test_audit_retry_does_not_duplicate_event", "publish should succeed after reconnecting");
  }
  std::size_t xadd_count = 0;
  std::size_t madd_count = 0;
  for (const auto& call : g_redis_mock.argv_calls) {
    if (call.front() == "XADD") {
      ++xadd_count;
    } else if (call.front() == "TS.MADD") {
      ++madd_count;
    }
  }
  if (xadd_count != 1) {
    return fail("test_audit_retry_does_not_duplicate_event", "event should be appended exactly once");
  }
  if (madd_count != 2 || g_redis_mock.connect_calls != 2) {
    return fail("test_audit_retry_does_not_duplicate_event", "only TS.MADD should be retried after reconnect");
  }
  return 0;
}

int test_audit_password_and_db() {
  g_redis_mock = {};
  auto options = audit_options();
  options.password = "hunter2";
  options.db = 3;
  RedisAuditSink sink(options);

  if (!sink.check_connectivity()) {
    return fail("test_audit_password_and_db", "connect should succeed");
  }
  if (g_redis_mock.commands.size() < 2 || g_redis_mock.commands[0] != "AUTH %s" ||
      g_redis_mock.commands[1] != "SELECT %d") {
    return fail("test_audit_password_and_db", "AUTH and SELECT should precede schema creation");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_audit_publishes_stream_and_metrics(); rc != 0) return rc;
  if (int rc = test_audit_skips_final_score_without_validation(); rc != 0) return rc;
  if (int rc = test_audit_without_timeseries_module(); rc != 0) return rc;
  if (int rc = test_audit_connect_failure_and_recovery(); rc != 0) return rc;
  if (int rc = test_audit_retry_does_not_duplicate_event(); rc != 0) return rc;
  if (int rc = test_audit_password_and_db(); rc != 0) return rc;

  std::cout << "[PASS] sinks unit tests\n";
  return 0;
}
