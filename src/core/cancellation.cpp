#include "core/cancellation.hpp"

namespace sle_agent::core {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void CancellationToken::tighten_deadline(const clock::time_point deadline) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!deadline_.has_value() || deadline < *deadline_) {
      deadline_ = deadline;
    }
  }
  cv_.notify_all();
}

void CancellationToken::tighten_deadline_after(const clock::duration budget) {
  tighten_deadline(clock::now() + budget);
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_ || (deadline_.has_value() && clock::now() >= *deadline_);
}

std::optional<CancellationToken::clock::time_point> CancellationToken::deadline() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadline_;
}

bool CancellationToken::wait_for(const clock::duration duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }

  auto wake_at = clock::now() + duration;
  bool cut_by_deadline = false;
  if (deadline_.has_value() && *deadline_ < wake_at) {
    wake_at = *deadline_;
    cut_by_deadline = true;
  }

  cv_.wait_until(lock, wake_at, [this] { return cancelled_; });
  if (cancelled_) {
    return false;
  }
  return !cut_by_deadline;
}

}  // namespace sle_agent::core
