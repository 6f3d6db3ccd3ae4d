#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/remediation.hpp"

struct redisContext;

namespace sle_agent::sinks {

// Appends every workflow outcome to the `<prefix>:events` stream and, when the
// RedisTimeSeries module is loaded, its numeric metrics to `<prefix>:<metric>`.
class RedisAuditSink {
 public:
  explicit RedisAuditSink(core::RedisAuditConfig options, std::uint32_t connect_timeout_ms = 1000);
  ~RedisAuditSink();

  RedisAuditSink(const RedisAuditSink&) = delete;
  RedisAuditSink& operator=(const RedisAuditSink&) = delete;
  RedisAuditSink(RedisAuditSink&&) noexcept;
  RedisAuditSink& operator=(RedisAuditSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::workflow_outcome& outcome);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::workflow_outcome& outcome, bool& event_appended);
  bool append_event(const model::workflow_outcome& outcome);
  bool add_metrics(const model::workflow_outcome& outcome);
  bool run_command();

  core::RedisAuditConfig options_;
  std::uint32_t connect_timeout_ms_{1000};
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
  bool was_ok_{true};
};

}  // namespace sle_agent::sinks
