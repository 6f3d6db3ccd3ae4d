#pragma once

#include <string>

#include "core/config.hpp"

namespace sle_agent::decision {

constexpr const char* kDefaultAction = "reboot";

// Lowest priority value wins; equal priorities keep the configured order.
// Falls back to kDefaultAction when sle_type has no strategy.
std::string select_action(const std::string& sle_type, const core::StrategyMap& strategies);

}  // namespace sle_agent::decision
