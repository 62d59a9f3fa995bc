#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bookrec::model {

/*
  Booking lifecycle as stored at the booking source.

  Ordinals are ordered so that a forward transition never decreases the
  value; the terminal states share the highest rank.
*/
enum class BookingStatus : std::uint8_t {
  kScheduled = 0,
  kRecording = 1,
  kCompleted = 2,
  kFailed    = 3,
  kCanceled  = 4,
};

constexpr bool IsTerminal(BookingStatus status) {
  return status == BookingStatus::kCompleted || status == BookingStatus::kFailed || status == BookingStatus::kCanceled;
}

constexpr bool CanTransition(BookingStatus from, BookingStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == BookingStatus::kScheduled) {
    return false;
  }

  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(BookingStatus status) {
  switch (status) {
    case BookingStatus::kScheduled:
      return "scheduled";
    case BookingStatus::kRecording:
      return "recording";
    case BookingStatus::kCompleted:
      return "completed";
    case BookingStatus::kFailed:
      return "failed";
    case BookingStatus::kCanceled:
      return "canceled";
  }
  return "unknown";
}

// "confirmed" is the legacy spelling written by the booking front end.
constexpr std::optional<BookingStatus> ParseBookingStatus(std::string_view value) {
  if (value == "scheduled" || value == "confirmed") return BookingStatus::kScheduled;
  if (value == "recording") return BookingStatus::kRecording;
  if (value == "completed") return BookingStatus::kCompleted;
  if (value == "failed") return BookingStatus::kFailed;
  if (value == "canceled" || value == "cancelled") return BookingStatus::kCanceled;
  return std::nullopt;
}

} // namespace bookrec::model
