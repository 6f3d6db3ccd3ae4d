#include "core/credentials.hpp"

#include <cstdlib>
#include <string>

#include "core/errors.hpp"

namespace sle_agent::core {
namespace {

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return fallback;
}

}  // namespace

Credentials load_credentials_from_env() {
  Credentials credentials{};
  credentials.api_token = getenv_or("MIST_API_TOKEN", "");
  credentials.site_id = getenv_or("SITE_ID", "");
  credentials.api_base = getenv_or("MIST_API_BASE", credentials.api_base);

  if (credentials.api_token.empty()) {
    throw ConfigError("MIST_API_TOKEN environment variable not set");
  }
  if (credentials.site_id.empty()) {
    throw ConfigError("SITE_ID environment variable not set");
  }

  while (!credentials.api_base.empty() && credentials.api_base.back() == '/') {
    credentials.api_base.pop_back();
  }
  return credentials;
}

}  // namespace sle_agent::core
