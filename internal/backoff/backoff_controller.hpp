#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "internal/util/time.hpp"

namespace bookrec::backoff {

struct BackoffPolicy {
  std::chrono::milliseconds initial_delay{2000};
  std::chrono::milliseconds max_delay{30000};
};

/*
  Delay after the n-th consecutive failure (n >= 1):

      min(initial * 2^(n-1), max)

  With the default policy: 2s, 4s, 8s, 16s, 30s, 30s, ...
*/
std::chrono::milliseconds ComputeBackoffDelay(std::uint32_t failure_count, const BackoffPolicy& policy);

/*
  Failure counter for one camera.

  Owned by that camera's lifecycle; never shared, so it carries no lock.
  Time is always passed in, nothing here sleeps.
*/
class BackoffController {
 public:
  explicit BackoffController(BackoffPolicy policy = {});

  // returns the delay that was applied
  std::chrono::milliseconds RecordFailure(util::TimePoint now);
  void                      RecordSuccess();

  bool MayAttempt(util::TimePoint now) const;

  std::uint32_t consecutive_failures() const {
    return consecutive_failures_;
  }

  std::optional<util::TimePoint> next_retry_at() const {
    return next_retry_at_;
  }

 private:
  BackoffPolicy                  policy_;
  std::uint32_t                  consecutive_failures_ = 0;
  std::optional<util::TimePoint> next_retry_at_;
};

} // namespace bookrec::backoff
