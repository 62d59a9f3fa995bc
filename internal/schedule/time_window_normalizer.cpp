#include "time_window_normalizer.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

#include <algorithm>
#include <vector>

#include "internal/util/errors.hpp"

namespace bookrec::schedule {

namespace {

constexpr const char* kOffsetFormats[] = {
    "%Y-%m-%d%ET%H:%M:%E*S%Ez",
    "%Y-%m-%d %H:%M:%E*S%Ez",
    "%Y-%m-%d%ET%H:%M%Ez",
    "%Y-%m-%d %H:%M%Ez",
};

bool AllDigits(absl::string_view value) {
  if (value.empty()) return false;
  for (char c : value) {
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

// Parses "+h", "-hh", "+hh:mm", "-hhmm" into seconds east of UTC.
bool ParseOffsetSeconds(absl::string_view value, int* seconds) {
  if (value.empty() || (value[0] != '+' && value[0] != '-')) return false;
  const int sign = value[0] == '-' ? -1 : 1;
  value.remove_prefix(1);

  int hours   = 0;
  int minutes = 0;
  if (auto colon = value.find(':'); colon != absl::string_view::npos) {
    auto h = value.substr(0, colon);
    auto m = value.substr(colon + 1);
    if (!AllDigits(h) || !AllDigits(m) || m.size() != 2) return false;
    if (!absl::SimpleAtoi(h, &hours) || !absl::SimpleAtoi(m, &minutes)) return false;
  } else if (AllDigits(value) && value.size() <= 2) {
    if (!absl::SimpleAtoi(value, &hours)) return false;
  } else if (AllDigits(value) && value.size() == 4) {
    if (!absl::SimpleAtoi(value.substr(0, 2), &hours) || !absl::SimpleAtoi(value.substr(2), &minutes)) return false;
  } else {
    return false;
  }

  if (hours > 14 || minutes > 59) return false;
  *seconds = sign * (hours * 3600 + minutes * 60);
  return true;
}

} // namespace

bool IsBareTime(const std::string& value) {
  std::vector<absl::string_view> parts = absl::StrSplit(value, ':');
  if (parts.size() != 2 && parts.size() != 3) return false;
  if (!AllDigits(parts[0]) || parts[0].size() > 2) return false;
  for (std::size_t i = 1; i < parts.size(); ++i) {
    if (!AllDigits(parts[i]) || parts[i].size() != 2) return false;
  }
  return true;
}

TimeWindowNormalizer::TimeWindowNormalizer(absl::TimeZone zone) : zone_(std::move(zone)) {
}

absl::TimeZone TimeWindowNormalizer::LoadReferenceZone(const std::string& zone_name) {
  const std::string trimmed(absl::StripAsciiWhitespace(zone_name));
  if (trimmed.empty()) {
    throw util::ConfigError("reference timezone must not be empty");
  }

  if (trimmed == "UTC" || trimmed == "Z" || trimmed == "GMT") {
    return absl::UTCTimeZone();
  }

  absl::string_view offset = trimmed;
  if (absl::StartsWith(offset, "UTC") || absl::StartsWith(offset, "GMT")) {
    offset.remove_prefix(3);
  }
  int seconds = 0;
  if (ParseOffsetSeconds(offset, &seconds)) {
    return absl::FixedTimeZone(seconds);
  }

  absl::TimeZone zone;
  if (!absl::LoadTimeZone(trimmed, &zone)) {
    throw util::ConfigError("unknown reference timezone: " + trimmed);
  }
  return zone;
}

util::TimePoint TimeWindowNormalizer::ResolveTime(const std::string& date, const std::string& time) const {
  const std::string value(absl::StripAsciiWhitespace(time));
  if (value.empty()) {
    throw util::InvalidTimeFormat("empty time field");
  }

  std::string err;
  absl::Time  parsed;

  if (IsBareTime(value)) {
    const std::string day(absl::StripAsciiWhitespace(date));
    if (day.empty()) {
      throw util::InvalidTimeFormat("bare time '" + value + "' requires a booking date");
    }
    const std::string with_seconds = std::count(value.begin(), value.end(), ':') == 1 ? value + ":00" : value;
    if (!absl::ParseTime("%Y-%m-%d %H:%M:%S", day + " " + with_seconds, zone_, &parsed, &err)) {
      throw util::InvalidTimeFormat("cannot combine date '" + day + "' with time '" + value + "': " + err);
    }
    return absl::ToChronoTime(parsed);
  }

  for (const char* format : kOffsetFormats) {
    if (absl::ParseTime(format, value, &parsed, &err)) {
      return absl::ToChronoTime(parsed);
    }
  }

  throw util::InvalidTimeFormat("unrecognized time value '" + value + "'");
}

model::Booking TimeWindowNormalizer::Normalize(const model::RawBooking& raw) const {
  model::Booking booking;
  booking.id        = raw.id;
  booking.camera_id = raw.camera_id;
  booking.user_id   = raw.user_id;

  if (auto status = model::ParseBookingStatus(raw.status)) {
    booking.status = *status;
  } else {
    throw util::InvalidBooking("unknown booking status '" + raw.status + "'");
  }

  booking.start = ResolveTime(raw.date, raw.start_time);
  booking.end   = ResolveTime(raw.date, raw.end_time);

  // offset-aware input is kept as written, bare input is rendered in the reference zone
  const std::string start_value(absl::StripAsciiWhitespace(raw.start_time));
  const std::string end_value(absl::StripAsciiWhitespace(raw.end_time));
  booking.start_text = IsBareTime(start_value) ? Format(booking.start) : start_value;
  booking.end_text   = IsBareTime(end_value) ? Format(booking.end) : end_value;

  if (booking.end <= booking.start) {
    throw util::InvalidBooking("booking " + raw.id + " has non-positive duration (" + booking.start_text + " .. " + booking.end_text + ")");
  }
  return booking;
}

std::string TimeWindowNormalizer::Format(util::TimePoint tp) const {
  return absl::FormatTime(absl::RFC3339_sec, absl::FromChrono(tp), zone_);
}

std::string TimeWindowNormalizer::FormatDate(util::TimePoint tp) const {
  return absl::FormatTime("%Y-%m-%d", absl::FromChrono(tp), zone_);
}

} // namespace bookrec::schedule
