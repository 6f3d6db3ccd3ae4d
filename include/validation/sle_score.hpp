#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sle_agent::validation {

// SLE types with a known location in the metrics document.
const std::vector<std::string>& known_sle_types();

// Follows the fixed path for sle_type (e.g. client.throughput.score). Returns
// nullopt for unknown types, missing paths and non-numeric values.
std::optional<double> extract_sle_score(const nlohmann::json& metrics, const std::string& sle_type);

}  // namespace sle_agent::validation
