#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/credentials.hpp"
#include "model/remediation.hpp"

namespace sle_agent::api {

// Device-control and SLE-metrics collaborator. Every call may throw
// core::TransportError; validate_credentials() throws core::AuthError when the
// remote rejects the token. Implementations are called from several workflow
// threads at once.
class DeviceApi {
 public:
  virtual model::ap_stats get_ap_stats(const std::string& ap_id) = 0;
  virtual model::ap_details get_ap_details(const std::string& ap_id) = 0;
  virtual nlohmann::json reboot_ap(const std::string& ap_id) = 0;
  // Empty site_id selects the configured site.
  virtual nlohmann::json get_sle_metrics(const std::string& site_id) = 0;
  virtual bool validate_credentials() = 0;
  virtual ~DeviceApi() = default;
};

std::unique_ptr<DeviceApi> make_mist_api(core::Credentials credentials, std::chrono::seconds timeout);

model::ap_stats parse_ap_stats(const nlohmann::json& document);
model::ap_details parse_ap_details(const nlohmann::json& document);

}  // namespace sle_agent::api
