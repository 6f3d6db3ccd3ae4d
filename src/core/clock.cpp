#include "core/clock.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace sle_agent::core {
namespace {

constexpr long kSecondsPerDay = 24 * 60 * 60;

class SystemClock final : public Clock {
 public:
  explicit SystemClock(std::unordered_map<std::string, long> offsets) : offsets_(std::move(offsets)) {}

  int local_minutes_of_day(const std::string& timezone) const override {
    const auto it = offsets_.find(timezone);
    if (it == offsets_.end()) {
      throw std::invalid_argument("timezone not resolved at startup: " + timezone);
    }
    return minutes_of_day_at(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()), it->second);
  }

 private:
  std::unordered_map<std::string, long> offsets_;
};

}  // namespace

long resolve_utc_offset(const std::string& timezone, const std::time_t at) {
  std::optional<std::string> previous{};
  if (const char* current = std::getenv("TZ"); current != nullptr) {
    previous = current;
  }

  ::setenv("TZ", timezone.c_str(), 1);
  ::tzset();
  std::tm local{};
  const bool converted = localtime_r(&at, &local) != nullptr;

  if (previous.has_value()) {
    ::setenv("TZ", previous->c_str(), 1);
  } else {
    ::unsetenv("TZ");
  }
  ::tzset();

  if (!converted) {
    throw std::runtime_error("unable to convert time in timezone " + timezone);
  }
  return local.tm_gmtoff;
}

int minutes_of_day_at(const std::time_t utc_seconds, const long utc_offset_seconds) noexcept {
  long local_seconds = (static_cast<long>(utc_seconds) + utc_offset_seconds) % kSecondsPerDay;
  if (local_seconds < 0) {
    local_seconds += kSecondsPerDay;
  }
  return static_cast<int>(local_seconds / 60);
}

std::unique_ptr<Clock> make_system_clock(const std::vector<std::string>& timezones) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::unordered_map<std::string, long> offsets;
  for (const auto& timezone : timezones) {
    const long offset = resolve_utc_offset(timezone, now);
    std::cerr << "[clock] timezone " << timezone << " resolved to UTC offset " << offset << "s\n";
    offsets.emplace(timezone, offset);
  }
  return std::make_unique<SystemClock>(std::move(offsets));
}

}  // namespace sle_agent::core
