#include "decision/guardrails.hpp"

#include <exception>
#include <iostream>
#include <sstream>

namespace sle_agent::decision {
namespace {

model::guardrail_result blocked(const std::string& ap_id, const std::string& reason) {
  std::cerr << "[guardrails] AP " << ap_id << " blocked: " << reason << '\n';
  return model::guardrail_result{false, reason};
}

}  // namespace

bool within_business_hours(const int minutes_of_day, const core::BusinessHours& hours) noexcept {
  if (hours.start_minute <= hours.end_minute) {
    return minutes_of_day >= hours.start_minute && minutes_of_day < hours.end_minute;
  }
  // Window wraps past midnight, e.g. 22:00-06:00.
  return minutes_of_day >= hours.start_minute || minutes_of_day < hours.end_minute;
}

GuardrailEvaluator::GuardrailEvaluator(api::DeviceApi& api, const core::Clock& clock) : api_(api), clock_(clock) {}

model::guardrail_result GuardrailEvaluator::evaluate(const std::string& ap_id,
                                                     const core::GuardrailConfig& guardrails) const {
  try {
    if (guardrails.business_hours_only) {
      const auto& hours = guardrails.business_hours;
      const int now_minutes = clock_.local_minutes_of_day(hours.timezone);
      if (!within_business_hours(now_minutes, hours)) {
        std::ostringstream reason;
        reason << "outside business hours (now " << core::format_time_of_day(now_minutes) << ", window "
               << core::format_time_of_day(hours.start_minute) << '-' << core::format_time_of_day(hours.end_minute)
               << ' ' << hours.timezone << ')';
        return blocked(ap_id, reason.str());
      }
    }

    const model::ap_stats stats = api_.get_ap_stats(ap_id);

    if (stats.num_clients < guardrails.min_clients) {
      std::ostringstream reason;
      reason << "client count (" << stats.num_clients << ") below minimum threshold (" << guardrails.min_clients
             << ')';
      return blocked(ap_id, reason.str());
    }

    // Uptime stands in for time since the last disruptive action.
    if (stats.uptime_s < guardrails.min_reboot_interval.count()) {
      std::ostringstream reason;
      reason << "AP uptime (" << stats.uptime_s << "s) below minimum reboot interval ("
             << guardrails.min_reboot_interval.count() << "s)";
      return blocked(ap_id, reason.str());
    }
  } catch (const std::exception& ex) {
    return blocked(ap_id, std::string("error: ") + ex.what());
  }

  std::cerr << "[guardrails] AP " << ap_id << " all checks passed\n";
  return model::guardrail_result{true, "all checks passed"};
}

}  // namespace sle_agent::decision
