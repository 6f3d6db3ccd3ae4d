#include "validation/validation_loop.hpp"

#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "core/timestamp.hpp"
#include "validation/sle_score.hpp"

namespace sle_agent::validation {
namespace {

constexpr const char* kOnlineStatus = "connected";

model::validation_result cancelled_result(model::validation_result result) {
  result.status = model::validation_status::FAILED;
  result.cancelled = true;
  result.reason = "cancelled";
  return result;
}

}  // namespace

ValidationSettings make_validation_settings(const core::ValidationConfig& config) {
  ValidationSettings settings{};
  settings.threshold = config.threshold_score;
  settings.poll_interval = std::chrono::duration_cast<std::chrono::milliseconds>(config.poll_interval);
  settings.max_attempts = config.max_attempts;
  settings.stabilization_delay = std::chrono::duration_cast<std::chrono::milliseconds>(config.stabilization_delay);
  return settings;
}

ValidationLoop::ValidationLoop(api::DeviceApi& api) : api_(api) {}

model::validation_result ValidationLoop::validate(const std::string& ap_id, const std::string& sle_type,
                                                  const ValidationSettings& settings,
                                                  core::CancellationToken& token) const {
  model::validation_result result{};

  std::cerr << "[validation] AP " << ap_id << ": waiting " << settings.stabilization_delay.count()
            << "ms for stabilization\n";
  if (settings.stabilization_delay.count() > 0 && !token.wait_for(settings.stabilization_delay)) {
    std::cerr << "[validation] AP " << ap_id << ": cancelled during stabilization\n";
    return cancelled_result(std::move(result));
  }
  if (token.cancelled()) {
    return cancelled_result(std::move(result));
  }

  try {
    const model::ap_stats stats = api_.get_ap_stats(ap_id);
    result.ap_status = stats.status;
    result.ap_online = stats.status == kOnlineStatus;
  } catch (const std::exception& ex) {
    result.ap_status = "unknown";
    result.ap_online = false;
    std::cerr << "[validation] AP " << ap_id << ": status check failed: " << ex.what() << '\n';
  }

  if (!result.ap_online) {
    result.status = model::validation_status::FAILED;
    result.reason = "device not online (status: " + result.ap_status + ")";
    std::cerr << "[validation] AP " << ap_id << ": " << result.reason << '\n';
    return result;
  }

  const auto polling_started = std::chrono::steady_clock::now();
  for (std::uint32_t index = 1; index <= settings.max_attempts; ++index) {
    if (token.cancelled()) {
      result.duration_seconds = core::seconds_since(polling_started);
      return cancelled_result(std::move(result));
    }

    auto attempt = poll_once(sle_type, index, settings.threshold);
    result.attempts.push_back(attempt);
    result.final_score = attempt.score;
    std::cerr << "[validation] AP " << ap_id << ": attempt " << index << '/' << settings.max_attempts
              << " score=" << (attempt.score_known ? std::to_string(attempt.score) : std::string("unknown")) << '\n';

    if (attempt.restored) {
      result.status = model::validation_status::RESTORED;
      std::ostringstream reason;
      reason << "SLE restored to " << attempt.score << " after " << index << " attempt(s)";
      result.reason = reason.str();
      result.duration_seconds = core::seconds_since(polling_started);
      return result;
    }

    if (index < settings.max_attempts && !token.wait_for(settings.poll_interval)) {
      result.duration_seconds = core::seconds_since(polling_started);
      return cancelled_result(std::move(result));
    }
  }

  result.status = model::validation_status::FAILED;
  std::ostringstream reason;
  reason << "SLE not restored after " << settings.max_attempts << " attempts (final score " << result.final_score
         << ", threshold " << settings.threshold << ')';
  result.reason = reason.str();
  result.duration_seconds = core::seconds_since(polling_started);
  return result;
}

model::validation_attempt ValidationLoop::poll_once(const std::string& sle_type, const std::uint32_t index,
                                                    const double threshold) const {
  model::validation_attempt attempt{};
  attempt.attempt_index = index;
  attempt.timestamp = core::iso8601_utc_now();

  try {
    const auto score = extract_sle_score(api_.get_sle_metrics(""), sle_type);
    if (score.has_value()) {
      attempt.score = *score;
      attempt.score_known = true;
    }
  } catch (const std::exception& ex) {
    std::cerr << "[validation] metrics fetch failed: " << ex.what() << '\n';
  }

  // An unknown score counts as 0.
  attempt.restored = attempt.score >= threshold;
  return attempt;
}

}  // namespace sle_agent::validation
