#include "backoff_controller.hpp"

#include <algorithm>

namespace bookrec::backoff {

std::chrono::milliseconds ComputeBackoffDelay(std::uint32_t failure_count, const BackoffPolicy& policy) {
  if (failure_count == 0) {
    return std::chrono::milliseconds::zero();
  }

  auto delay = policy.initial_delay;
  for (std::uint32_t i = 1; i < failure_count && delay < policy.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_delay);
}

BackoffController::BackoffController(BackoffPolicy policy) : policy_(policy) {
}

std::chrono::milliseconds BackoffController::RecordFailure(util::TimePoint now) {
  ++consecutive_failures_;
  const auto delay = ComputeBackoffDelay(consecutive_failures_, policy_);
  next_retry_at_   = now + delay;
  return delay;
}

void BackoffController::RecordSuccess() {
  consecutive_failures_ = 0;
  next_retry_at_.reset();
}

bool BackoffController::MayAttempt(util::TimePoint now) const {
  return !next_retry_at_ || now >= *next_retry_at_;
}

} // namespace bookrec::backoff
