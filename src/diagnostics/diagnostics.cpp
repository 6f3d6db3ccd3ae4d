#include "diagnostics/diagnostics.hpp"

#include <exception>
#include <iostream>

#include "core/timestamp.hpp"
#include "decision/severity.hpp"
#include "validation/sle_score.hpp"

namespace sle_agent::diagnostics {

model::ap_diagnostics collect_ap_diagnostics(api::DeviceApi& api, const std::string& ap_id) {
  model::ap_diagnostics diagnostics{};
  diagnostics.timestamp = core::iso8601_utc_now();
  diagnostics.ap_id = ap_id;

  try {
    diagnostics.stats = api.get_ap_stats(ap_id);
    diagnostics.details = api.get_ap_details(ap_id);
    diagnostics.ok = true;
    std::cerr << "[diagnostics] AP " << ap_id << " status=" << diagnostics.stats.status
              << " clients=" << diagnostics.stats.num_clients << " uptime=" << diagnostics.stats.uptime_s << "s\n";
  } catch (const std::exception& ex) {
    diagnostics.ok = false;
    diagnostics.error = ex.what();
    std::cerr << "[diagnostics] AP " << ap_id << " collection failed: " << ex.what() << '\n';
  }

  return diagnostics;
}

model::sle_diagnostics collect_sle_diagnostics(api::DeviceApi& api, const std::string& sle_type,
                                               const core::RulesConfig& config) {
  model::sle_diagnostics diagnostics{};
  diagnostics.timestamp = core::iso8601_utc_now();
  diagnostics.sle_type = sle_type;

  try {
    const nlohmann::json metrics = api.get_sle_metrics("");
    diagnostics.score = validation::extract_sle_score(metrics, sle_type);

    for (const auto& known : validation::known_sle_types()) {
      const auto score = validation::extract_sle_score(metrics, known);
      if (!score.has_value() || *score >= config.validation.threshold_score) {
        continue;
      }
      diagnostics.issues.push_back(model::sle_issue{known, *score, decision::classify(*score, config.thresholds)});
    }

    diagnostics.ok = true;
    std::cerr << "[diagnostics] SLE " << sle_type << ": " << diagnostics.issues.size() << " issue(s) detected\n";
  } catch (const std::exception& ex) {
    diagnostics.ok = false;
    diagnostics.error = ex.what();
    std::cerr << "[diagnostics] SLE metrics collection failed: " << ex.what() << '\n';
  }

  return diagnostics;
}

}  // namespace sle_agent::diagnostics
