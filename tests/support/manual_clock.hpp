#pragma once

#include <chrono>
#include <mutex>

#include "internal/util/time.hpp"

namespace bookrec::test {

// Clock that only moves when the test advances it.
class ManualClock final : public util::ClockSource {
 public:
  explicit ManualClock(util::TimePoint start) : now_(start) {
  }

  util::TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Set(util::TimePoint tp) {
    std::lock_guard lock(mutex_);
    now_ = tp;
  }

  void Advance(std::chrono::milliseconds delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
  }

 private:
  mutable std::mutex mutex_;
  util::TimePoint    now_;
};

// 2024-05-14T14:00:00Z
inline util::TimePoint ReferenceInstant() {
  return util::TimePoint(std::chrono::seconds(1715695200));
}

} // namespace bookrec::test
