#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace sle_agent::core {

// Cancellation flag plus optional deadline shared between a workflow and the
// thread that drives it. Waits wake up as soon as either trips.
class CancellationToken {
 public:
  using clock = std::chrono::steady_clock;

  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel();

  // Only ever moves the deadline earlier.
  void tighten_deadline(clock::time_point deadline);
  void tighten_deadline_after(clock::duration budget);

  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] std::optional<clock::time_point> deadline() const;

  // Returns true when the full duration elapsed, false when the wait was cut
  // short by cancel() or by the deadline.
  bool wait_for(clock::duration duration);

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_{false};
  std::optional<clock::time_point> deadline_{};
};

}  // namespace sle_agent::core
