#pragma once

#include <string>

namespace sle_agent::core {

struct Credentials {
  std::string api_token{};
  std::string site_id{};
  std::string api_base{"https://api.mist.com/api/v1"};
};

// Reads MIST_API_TOKEN, SITE_ID and the optional MIST_API_BASE.
// Throws ConfigError when a required variable is missing or empty.
Credentials load_credentials_from_env();

}  // namespace sle_agent::core
