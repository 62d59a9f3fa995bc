#pragma once

#include <string>

#include "booking_status.hpp"
#include "internal/util/time.hpp"

namespace bookrec::model {

/*
  Booking row exactly as the source returned it. Time fields are either
  bare local times or offset-aware timestamps; only the normalizer reads
  them.
*/
struct RawBooking {
  std::string id;
  std::string camera_id;
  std::string user_id;
  std::string date;
  std::string start_time;
  std::string end_time;
  std::string status;
};

/*
  Validated booking with an absolute, positive-length window.
*/
struct Booking {
  std::string     id;
  std::string     camera_id;
  std::string     user_id;
  util::TimePoint start;
  util::TimePoint end;
  BookingStatus   status = BookingStatus::kScheduled;

  // start/end rendered in the reference timezone, for logs and catalog rows
  std::string start_text;
  std::string end_text;
};

inline bool Overlaps(const Booking& a, const Booking& b) {
  return a.start < b.end && b.start < a.end;
}

} // namespace bookrec::model
