#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace sle_agent::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z.
inline std::string iso8601_utc(const std::chrono::system_clock::time_point time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  char result[40]{};
  std::snprintf(result, sizeof(result), "%.*s.%03dZ", static_cast<int>(written), buffer,
                static_cast<int>(millis < 0 ? 0 : millis));
  return result;
}

inline std::string iso8601_utc_now() { return iso8601_utc(std::chrono::system_clock::now()); }

inline double seconds_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace sle_agent::core
