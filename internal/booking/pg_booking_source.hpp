#pragma once

#include <memory>

#include "booking_source.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace bookrec::booking {

/*
  BookingSource over the shared PostgreSQL bookings table.

  Status writes are guarded in SQL: the UPDATE only matches rows whose
  current status may legally move to the new one, so a booking canceled
  by a user between our read and our write is never overwritten.
*/
class PgBookingSource final : public BookingSource {
 public:
  explicit PgBookingSource(std::shared_ptr<db::postgres::PgPool> pool);

  std::vector<model::RawBooking>                         FetchCandidates(const CandidateQuery& query) override;
  std::vector<model::RawBooking>                         FetchInProgress(const CandidateQuery& query) override;
  std::unordered_map<std::string, model::BookingStatus> FetchStatuses(const std::vector<std::string>& ids) override;
  db::Result UpdateStatus(const std::string& id, model::BookingStatus status, const std::string& reason) override;
  db::Result RecordArtifact(const ArtifactRecord& record) override;

 private:
  static db::Result                     Translate(const std::exception& e);
  static std::vector<model::RawBooking> ReadBookings(const pqxx::result& res);

  std::shared_ptr<db::postgres::PgPool> pool_;
};

// Stored spellings of every status allowed to move to `to`.
std::vector<std::string> AllowedPredecessors(model::BookingStatus to);

} // namespace bookrec::booking
