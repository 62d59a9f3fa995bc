#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/booking.hpp"

namespace bookrec::booking {

struct CandidateQuery {
  std::vector<std::string> camera_ids;
  std::string              user_id; // empty matches any user

  // inclusive booking-date range, YYYY-MM-DD in the reference timezone
  std::string from_date;
  std::string to_date;
};

// Uploaded artifact, recorded in the source's catalog.
struct ArtifactRecord {
  std::string   booking_id;
  std::string   camera_id;
  std::string   user_id;
  std::string   local_path;
  std::string   remote_url;
  std::uint64_t size_bytes = 0;
  std::string   started_at; // RFC3339
};

/*
  Where bookings live.

  Reads throw util::TransientSourceError when the source is unreachable;
  the poller treats that as "skip this cycle". Writes report db::Result so
  callers can retry transient failures without exception plumbing.
*/
class BookingSource {
 public:
  virtual ~BookingSource() = default;

  // scheduled bookings for the given cameras whose date falls in range
  virtual std::vector<model::RawBooking> FetchCandidates(const CandidateQuery& query) = 0;

  // bookings for the given cameras still marked recording; the date range is ignored
  virtual std::vector<model::RawBooking> FetchInProgress(const CandidateQuery& query) = 0;

  // current status of each id; ids missing from the map no longer exist
  virtual std::unordered_map<std::string, model::BookingStatus> FetchStatuses(const std::vector<std::string>& ids) = 0;

  // Conflict when the stored status cannot move to `status`, NotFound when the id is gone
  virtual db::Result UpdateStatus(const std::string& id, model::BookingStatus status, const std::string& reason) = 0;

  // idempotent on booking_id
  virtual db::Result RecordArtifact(const ArtifactRecord& record) = 0;
};

} // namespace bookrec::booking
