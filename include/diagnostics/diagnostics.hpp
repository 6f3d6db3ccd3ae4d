#pragma once

#include <string>

#include "api/device_api.hpp"
#include "core/config.hpp"
#include "model/remediation.hpp"

namespace sle_agent::diagnostics {

// Stats and details snapshot. Collaborator failures land in `error` with ok=false.
model::ap_diagnostics collect_ap_diagnostics(api::DeviceApi& api, const std::string& ap_id);

// Fetches the site SLE document once, records the score for sle_type and one
// issue per known SLE type scoring below validation.threshold_score.
model::sle_diagnostics collect_sle_diagnostics(api::DeviceApi& api, const std::string& sle_type,
                                               const core::RulesConfig& config);

}  // namespace sle_agent::diagnostics
