#pragma once

#include <stdexcept>
#include <string>

namespace sle_agent::core {

// Missing credentials or malformed rules. Fatal before any external call.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// A collaborator call failed on the network, HTTP or payload level.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

// The remote API rejected the supplied credentials.
class AuthError : public std::runtime_error {
 public:
  explicit AuthError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace sle_agent::core
