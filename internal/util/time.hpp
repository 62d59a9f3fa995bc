#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace bookrec::util {

/*
  Time utilities. Components never read the system clock directly; they
  take a ClockSource so loops can be driven by a manual clock in tests.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public ClockSource {
 public:
  TimePoint Now() const override;
};

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace bookrec::util
