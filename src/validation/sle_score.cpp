#include "validation/sle_score.hpp"

#include <array>
#include <unordered_map>

namespace sle_agent::validation {
namespace {

using SlePath = std::array<const char*, 3>;

const std::unordered_map<std::string, SlePath>& sle_paths() {
  static const std::unordered_map<std::string, SlePath> kPaths = {
      {"throughput", {"client", "throughput", "score"}},
      {"successful-connects", {"client", "successful-connects", "score"}},
      {"gateway-availability", {"infrastructure", "gateway-availability", "score"}},
      {"dhcp-performance", {"infrastructure", "dhcp-performance", "score"}},
      {"dns-performance", {"infrastructure", "dns-performance", "score"}},
  };
  return kPaths;
}

}  // namespace

const std::vector<std::string>& known_sle_types() {
  static const std::vector<std::string> kTypes = {
      "throughput", "successful-connects", "gateway-availability", "dhcp-performance", "dns-performance",
  };
  return kTypes;
}

std::optional<double> extract_sle_score(const nlohmann::json& metrics, const std::string& sle_type) {
  const auto path_it = sle_paths().find(sle_type);
  if (path_it == sle_paths().end()) {
    return std::nullopt;
  }

  const nlohmann::json* node = &metrics;
  for (const char* key : path_it->second) {
    if (!node->is_object()) {
      return std::nullopt;
    }
    const auto child = node->find(key);
    if (child == node->end()) {
      return std::nullopt;
    }
    node = &(*child);
  }

  if (!node->is_number()) {
    return std::nullopt;
  }
  return node->get<double>();
}

}  // namespace sle_agent::validation
