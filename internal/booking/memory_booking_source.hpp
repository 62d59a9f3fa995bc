#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "booking_source.hpp"

namespace bookrec::booking {

/*
  In-process booking source.

  Used when no database is configured and as the source in tests. The
  availability switches let tests simulate an unreachable source and
  failing writes.
*/
class MemoryBookingSource final : public BookingSource {
 public:
  std::vector<model::RawBooking>                         FetchCandidates(const CandidateQuery& query) override;
  std::vector<model::RawBooking>                         FetchInProgress(const CandidateQuery& query) override;
  std::unordered_map<std::string, model::BookingStatus> FetchStatuses(const std::vector<std::string>& ids) override;
  db::Result UpdateStatus(const std::string& id, model::BookingStatus status, const std::string& reason) override;
  db::Result RecordArtifact(const ArtifactRecord& record) override;

  void Put(const model::RawBooking& booking);
  void Remove(const std::string& id);
  // external status change (e.g. a user cancels), bypasses the transition guard
  void ForceStatus(const std::string& id, const std::string& status);

  std::optional<model::RawBooking> Get(const std::string& id) const;
  std::string                      Reason(const std::string& id) const;
  std::optional<ArtifactRecord>    Artifact(const std::string& booking_id) const;
  std::size_t                      ArtifactCount() const;

  void SetReadable(bool readable);
  void SetWritable(bool writable);

 private:
  mutable std::mutex                    mutex_;
  std::map<std::string, model::RawBooking> bookings_;
  std::map<std::string, std::string>    reasons_;
  std::map<std::string, ArtifactRecord> artifacts_;
  bool                                  readable_ = true;
  bool                                  writable_ = true;
};

} // namespace bookrec::booking
