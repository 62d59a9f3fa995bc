#include "memory_booking_source.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace bookrec::booking {

std::vector<model::RawBooking> MemoryBookingSource::FetchCandidates(const CandidateQuery& query) {
  std::lock_guard lock(mutex_);
  if (!readable_) {
    throw util::TransientSourceError("memory booking source is unavailable");
  }

  std::vector<model::RawBooking> out;
  for (const auto& [id, booking] : bookings_) {
    if (std::find(query.camera_ids.begin(), query.camera_ids.end(), booking.camera_id) == query.camera_ids.end()) {
      continue;
    }
    if (!query.user_id.empty() && booking.user_id != query.user_id) {
      continue;
    }
    if (model::ParseBookingStatus(booking.status) != model::BookingStatus::kScheduled) {
      continue;
    }
    // bookings with offset-aware times may carry no date; they are always candidates
    if (!booking.date.empty() && (booking.date < query.from_date || booking.date > query.to_date)) {
      continue;
    }
    out.push_back(booking);
  }
  return out;
}

std::vector<model::RawBooking> MemoryBookingSource::FetchInProgress(const CandidateQuery& query) {
  std::lock_guard lock(mutex_);
  if (!readable_) {
    throw util::TransientSourceError("memory booking source is unavailable");
  }

  std::vector<model::RawBooking> out;
  for (const auto& [id, booking] : bookings_) {
    if (std::find(query.camera_ids.begin(), query.camera_ids.end(), booking.camera_id) == query.camera_ids.end()) {
      continue;
    }
    if (!query.user_id.empty() && booking.user_id != query.user_id) {
      continue;
    }
    if (model::ParseBookingStatus(booking.status) == model::BookingStatus::kRecording) {
      out.push_back(booking);
    }
  }
  return out;
}

std::unordered_map<std::string, model::BookingStatus> MemoryBookingSource::FetchStatuses(const std::vector<std::string>& ids) {
  std::lock_guard lock(mutex_);
  if (!readable_) {
    throw util::TransientSourceError("memory booking source is unavailable");
  }

  std::unordered_map<std::string, model::BookingStatus> out;
  for (const auto& id : ids) {
    auto it = bookings_.find(id);
    if (it == bookings_.end()) {
      continue;
    }
    if (auto status = model::ParseBookingStatus(it->second.status)) {
      out.emplace(id, *status);
    }
  }
  return out;
}

db::Result MemoryBookingSource::UpdateStatus(const std::string& id, model::BookingStatus status, const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (!writable_) {
    return db::Result::Err(db::ErrorCode::Unavailable, "memory booking source rejects writes");
  }

  auto it = bookings_.find(id);
  if (it == bookings_.end()) {
    return db::Result::Err(db::ErrorCode::NotFound, "booking " + id + " not found");
  }

  const auto current = model::ParseBookingStatus(it->second.status);
  if (!current || !model::CanTransition(*current, status)) {
    return db::Result::Err(db::ErrorCode::Conflict,
                           "booking " + id + " cannot move from " + it->second.status + " to " + std::string(model::ToString(status)));
  }

  it->second.status = std::string(model::ToString(status));
  if (!reason.empty()) {
    reasons_[id] = reason;
  }
  return db::Result::Ok();
}

db::Result MemoryBookingSource::RecordArtifact(const ArtifactRecord& record) {
  std::lock_guard lock(mutex_);
  if (!writable_) {
    return db::Result::Err(db::ErrorCode::Unavailable, "memory booking source rejects writes");
  }
  artifacts_[record.booking_id] = record;
  return db::Result::Ok();
}

void MemoryBookingSource::Put(const model::RawBooking& booking) {
  std::lock_guard lock(mutex_);
  bookings_[booking.id] = booking;
}

void MemoryBookingSource::Remove(const std::string& id) {
  std::lock_guard lock(mutex_);
  bookings_.erase(id);
}

void MemoryBookingSource::ForceStatus(const std::string& id, const std::string& status) {
  std::lock_guard lock(mutex_);
  if (auto it = bookings_.find(id); it != bookings_.end()) {
    it->second.status = status;
  }
}

std::optional<model::RawBooking> MemoryBookingSource::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = bookings_.find(id);
  if (it == bookings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string MemoryBookingSource::Reason(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = reasons_.find(id);
  return it == reasons_.end() ? std::string{} : it->second;
}

std::optional<ArtifactRecord> MemoryBookingSource::Artifact(const std::string& booking_id) const {
  std::lock_guard lock(mutex_);
  auto            it = artifacts_.find(booking_id);
  if (it == artifacts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MemoryBookingSource::ArtifactCount() const {
  std::lock_guard lock(mutex_);
  return artifacts_.size();
}

void MemoryBookingSource::SetReadable(bool readable) {
  std::lock_guard lock(mutex_);
  readable_ = readable;
}

void MemoryBookingSource::SetWritable(bool writable) {
  std::lock_guard lock(mutex_);
  writable_ = writable;
}

} // namespace bookrec::booking
