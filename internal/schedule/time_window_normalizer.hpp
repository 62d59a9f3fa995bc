#pragma once

#include <string>

#include <absl/time/time.h>

#include "internal/model/booking.hpp"
#include "internal/util/time.hpp"

namespace bookrec::schedule {

/*
  Resolves booking time fields into absolute instants.

  Accepted forms per field:
    HH:MM / HH:MM:SS                 combined with the booking date in the
                                     reference timezone
    YYYY-MM-DDTHH:MM[:SS[.f]]<off>   offset-aware, used as is (date ignored)
                                     'T' may be a space, <off> is Z or +hh[:mm]

  The reference timezone is configured, never inferred from the host.
*/
class TimeWindowNormalizer {
 public:
  explicit TimeWindowNormalizer(absl::TimeZone zone);

  // "UTC", "UTC-4", "UTC+05:30", "-04:00" or an IANA name. Throws ConfigError.
  static absl::TimeZone LoadReferenceZone(const std::string& zone_name);

  // Throws InvalidTimeFormat or InvalidBooking.
  model::Booking Normalize(const model::RawBooking& raw) const;

  util::TimePoint ResolveTime(const std::string& date, const std::string& time) const;

  std::string Format(util::TimePoint tp) const;
  std::string FormatDate(util::TimePoint tp) const;

  const absl::TimeZone& zone() const {
    return zone_;
  }

 private:
  absl::TimeZone zone_;
};

bool IsBareTime(const std::string& value);

} // namespace bookrec::schedule
