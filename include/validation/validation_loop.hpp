#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "api/device_api.hpp"
#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "model/remediation.hpp"

namespace sle_agent::validation {

struct ValidationSettings {
  double threshold{90.0};
  std::chrono::milliseconds poll_interval{60000};
  std::uint32_t max_attempts{5};
  std::chrono::milliseconds stabilization_delay{60000};
};

ValidationSettings make_validation_settings(const core::ValidationConfig& config);

// Polls the SLE score after a remediation until it reaches the threshold,
// the attempt budget is spent, or the token is cancelled / past its deadline.
// Never issues a mutating call.
class ValidationLoop {
 public:
  explicit ValidationLoop(api::DeviceApi& api);

  model::validation_result validate(const std::string& ap_id, const std::string& sle_type,
                                    const ValidationSettings& settings, core::CancellationToken& token) const;

 private:
  model::validation_attempt poll_once(const std::string& sle_type, std::uint32_t index, double threshold) const;

  api::DeviceApi& api_;
};

}  // namespace sle_agent::validation
