#include "pg_booking_source.hpp"

#include "internal/util/errors.hpp"

namespace bookrec::booking {

namespace {

constexpr model::BookingStatus kAllStatuses[] = {model::BookingStatus::kScheduled, model::BookingStatus::kRecording,
                                                 model::BookingStatus::kCompleted, model::BookingStatus::kFailed,
                                                 model::BookingStatus::kCanceled};

} // namespace

std::vector<std::string> AllowedPredecessors(model::BookingStatus to) {
  std::vector<std::string> out;
  for (auto from : kAllStatuses) {
    if (!model::CanTransition(from, to)) {
      continue;
    }
    out.emplace_back(model::ToString(from));
    if (from == model::BookingStatus::kScheduled) out.emplace_back("confirmed");
    if (from == model::BookingStatus::kCanceled) out.emplace_back("cancelled");
  }
  return out;
}

PgBookingSource::PgBookingSource(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
}

db::Result PgBookingSource::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return db::Result::Err(db::ErrorCode::Unavailable, e.what());
  }
  if (dynamic_cast<const pqxx::query_canceled*>(&e) != nullptr) {
    return db::Result::Err(db::ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) != nullptr) {
    return db::Result::Err(db::ErrorCode::ConstraintViolation, e.what());
  }
  return db::Result::Err(db::ErrorCode::InternalError, e.what());
}

std::vector<model::RawBooking> PgBookingSource::ReadBookings(const pqxx::result& res) {
  std::vector<model::RawBooking> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RawBooking r;
    r.id         = row[0].c_str();
    r.camera_id  = row[1].c_str();
    r.user_id    = row[2].c_str();
    r.date       = row[3].c_str();
    r.start_time = row[4].is_null() ? "" : row[4].c_str();
    r.end_time   = row[5].is_null() ? "" : row[5].c_str();
    r.status     = row[6].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::RawBooking> PgBookingSource::FetchCandidates(const CandidateQuery& query) {
  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction tx(*conn);
    return ReadBookings(tx.exec_prepared("fetch_candidates", query.camera_ids, query.user_id, query.from_date, query.to_date));
  } catch (const pqxx::sql_error& e) {
    throw util::TransientSourceError(std::string("candidate query failed: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw util::TransientSourceError(std::string("booking source unreachable: ") + e.what());
  }
}

std::vector<model::RawBooking> PgBookingSource::FetchInProgress(const CandidateQuery& query) {
  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction tx(*conn);
    return ReadBookings(tx.exec_prepared("fetch_in_progress", query.camera_ids, query.user_id));
  } catch (const pqxx::sql_error& e) {
    throw util::TransientSourceError(std::string("in-progress query failed: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw util::TransientSourceError(std::string("booking source unreachable: ") + e.what());
  }
}

std::unordered_map<std::string, model::BookingStatus> PgBookingSource::FetchStatuses(const std::vector<std::string>& ids) {
  std::unordered_map<std::string, model::BookingStatus> out;
  if (ids.empty()) {
    return out;
  }

  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction tx(*conn);
    auto                 res = tx.exec_prepared("fetch_statuses", ids);

    for (const auto& row : res) {
      if (auto status = model::ParseBookingStatus(row[1].c_str())) {
        out.emplace(row[0].c_str(), *status);
      }
    }
    return out;
  } catch (const pqxx::sql_error& e) {
    throw util::TransientSourceError(std::string("status query failed: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw util::TransientSourceError(std::string("booking source unreachable: ") + e.what());
  }
}

db::Result PgBookingSource::UpdateStatus(const std::string& id, model::BookingStatus status, const std::string& reason) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);

    auto res = tx.exec_prepared("update_status", id, std::string(model::ToString(status)), reason, AllowedPredecessors(status));
    if (res.affected_rows() == 0) {
      auto current = tx.exec_prepared("booking_status", id);
      tx.commit();
      if (current.empty()) {
        return db::Result::Err(db::ErrorCode::NotFound, "booking " + id + " not found");
      }
      return db::Result::Err(db::ErrorCode::Conflict, "booking " + id + " is " + current[0][0].c_str() + ", cannot move to " +
                                                          std::string(model::ToString(status)));
    }

    tx.commit();
    return db::Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

db::Result PgBookingSource::RecordArtifact(const ArtifactRecord& record) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("record_artifact", record.booking_id, record.camera_id, record.user_id, record.local_path, record.remote_url,
                     static_cast<std::int64_t>(record.size_bytes), record.started_at);
    tx.commit();
    return db::Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace bookrec::booking
