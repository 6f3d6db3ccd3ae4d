#pragma once

#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace sle_agent::core {

class Clock {
 public:
  // Minutes since local midnight in the named IANA timezone.
  virtual int local_minutes_of_day(const std::string& timezone) const = 0;
  virtual ~Clock() = default;
};

// Resolves every zone once while the process is still single-threaded; later
// conversions apply the stored offset and never touch the environment.
// A DST change during a run is not tracked.
std::unique_ptr<Clock> make_system_clock(const std::vector<std::string>& timezones);

// Seconds east of UTC for timezone at the given instant. Swaps TZ in the
// process environment, so only call it before worker threads start.
long resolve_utc_offset(const std::string& timezone, std::time_t at);

int minutes_of_day_at(std::time_t utc_seconds, long utc_offset_seconds) noexcept;

}  // namespace sle_agent::core
