#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/remediation.hpp"

namespace sle_agent::report {

nlohmann::json to_json(const model::remediation_attempt& attempt);
nlohmann::json to_json(const model::validation_result& result);
nlohmann::json to_json(const model::ap_diagnostics& diagnostics);
nlohmann::json to_json(const model::sle_diagnostics& diagnostics);

// Full outcome document written to --output.
nlohmann::json to_json(const model::workflow_outcome& outcome);

// Single object for one outcome, array for several.
nlohmann::json to_json(const std::vector<model::workflow_outcome>& outcomes);

// Compact one-line view used by the stdout sink and the audit stream.
nlohmann::json summary_json(const model::workflow_outcome& outcome);

// Serializes a report document. Collaborator text may carry raw bytes, so
// invalid UTF-8 is replaced with U+FFFD instead of throwing.
std::string serialize(const nlohmann::json& document, int indent = -1);

}  // namespace sle_agent::report
