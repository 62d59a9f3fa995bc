#include "booking_poller.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace bookrec::booking {

using observability::IntField;
using observability::StringField;

BookingPoller::BookingPoller(PollerSettings settings, std::shared_ptr<BookingSource> source, schedule::TimeWindowNormalizer normalizer,
                             std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras, std::shared_ptr<upload::UploadQueue> uploads,
                             std::shared_ptr<util::ClockSource> clock)
    : settings_(std::move(settings)),
      source_(std::move(source)),
      normalizer_(std::move(normalizer)),
      cameras_(std::move(cameras)),
      uploads_(std::move(uploads)),
      clock_(std::move(clock)) {
}

BookingPoller::~BookingPoller() {
  Stop();
}

PollReport BookingPoller::PollOnce() {
  observability::SpanScope span("poller.cycle");
  PollReport               report;
  const auto               now = clock_->Now();

  CandidateQuery query;
  query.user_id   = settings_.user_id;
  query.from_date = normalizer_.FormatDate(now - settings_.max_booking_age);
  query.to_date   = normalizer_.FormatDate(now + settings_.lookahead);
  for (const auto& camera : cameras_) {
    query.camera_ids.push_back(camera->camera_id());
  }

  try {
    const auto rows   = source_->FetchCandidates(query);
    report.candidates = rows.size();

    std::map<std::string, std::vector<model::Booking>> by_camera;
    for (const auto& raw : rows) {
      try {
        storage::common::ValidateBookingId(raw.id);
        by_camera[raw.camera_id].push_back(normalizer_.Normalize(raw));
      } catch (const std::exception& e) {
        ++report.invalid;
        if (reported_invalid_.insert(raw.id).second) {
          BOOKREC_LOG_WARN("Invalid booking skipped", {StringField("booking_id", raw.id), StringField("camera_id", raw.camera_id),
                                                       StringField("date", raw.date), StringField("start_time", raw.start_time),
                                                       StringField("end_time", raw.end_time), StringField("error", e.what())});
        }
        MarkFailed(raw.id, std::string("invalid booking: ") + e.what());
      }
    }

    for (const auto& camera : cameras_) {
      auto it = by_camera.find(camera->camera_id());
      if (it != by_camera.end()) {
        Schedule(*camera, std::move(it->second), now, report);
      }
    }

    RecoverInterrupted(query, report);
    CheckCancellations(report);
    report.ok = true;
  } catch (const util::TransientSourceError& e) {
    span.RecordException(e.what());
    BOOKREC_LOG_WARN("Booking source unavailable, skipping cycle", {StringField("error", e.what())});
  }

  observability::Metrics::Instance().RecordPollCycle(report.ok);
  span.SetAttribute("candidates", static_cast<std::int64_t>(report.candidates));
  span.SetAttribute("offered", static_cast<std::int64_t>(report.offered));
  return report;
}

void BookingPoller::Schedule(camera::CameraLifecycle& camera, std::vector<model::Booking> bookings, util::TimePoint now, PollReport& report) {
  std::sort(bookings.begin(), bookings.end(), [](const model::Booking& a, const model::Booking& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.id < b.id;
  });

  std::vector<model::Booking> kept;
  for (auto& booking : bookings) {
    if (camera.IsTracking(booking.id)) {
      kept.push_back(std::move(booking));
      continue;
    }

    if (booking.end <= now) {
      ++report.missed;
      BOOKREC_LOG_WARN("Booking window elapsed without a recording",
                       {StringField("camera_id", camera.camera_id()), StringField("booking_id", booking.id), StringField("end", booking.end_text)});
      MarkFailed(booking.id, "missed: window elapsed before recording started");
      continue;
    }

    auto winner = std::find_if(kept.begin(), kept.end(), [&](const model::Booking& k) { return model::Overlaps(k, booking); });
    if (winner != kept.end()) {
      ++report.conflicts;
      BOOKREC_LOG_WARN("Overlapping booking rejected", {StringField("camera_id", camera.camera_id()), StringField("booking_id", booking.id),
                                                        StringField("winner", winner->id)});
      MarkFailed(booking.id, "conflict: overlaps booking " + winner->id);
      continue;
    }

    kept.push_back(std::move(booking));
  }

  const auto horizon = now + settings_.poll_interval;
  for (const auto& booking : kept) {
    if (booking.start > horizon) {
      break;
    }

    try {
      if (camera.Offer(booking) == camera::OfferOutcome::kAccepted) {
        ++report.offered;
      }
    } catch (const util::ResourceConflictError& e) {
      ++report.conflicts;
      BOOKREC_LOG_WARN("Booking conflicts with camera's current booking",
                       {StringField("camera_id", camera.camera_id()), StringField("booking_id", booking.id), StringField("error", e.what())});
      MarkFailed(booking.id, std::string("conflict: ") + e.what());
    }
  }
}

void BookingPoller::RecoverInterrupted(const CandidateQuery& query, PollReport& report) {
  for (const auto& raw : source_->FetchInProgress(query)) {
    if (IsTracked(raw.id)) {
      continue;
    }

    const bool uploaded = uploads_->Find(raw.id).has_value();
    const auto status   = uploaded ? model::BookingStatus::kCompleted : model::BookingStatus::kFailed;
    auto       result   = source_->UpdateStatus(raw.id, status, uploaded ? "" : "recording interrupted before an artifact was saved");
    if (!result) {
      BOOKREC_LOG_WARN("Could not settle interrupted booking", {StringField("booking_id", raw.id), StringField("error", result.message)});
      continue;
    }

    ++report.recovered;
    BOOKREC_LOG_WARN("Interrupted recording settled", {StringField("camera_id", raw.camera_id), StringField("booking_id", raw.id),
                                                       StringField("status", model::ToString(status))});
  }
}

bool BookingPoller::IsTracked(const std::string& booking_id) const {
  return std::any_of(cameras_.begin(), cameras_.end(), [&](const auto& camera) { return camera->IsTracking(booking_id); });
}

void BookingPoller::CheckCancellations(PollReport& report) {
  std::vector<std::string> tracked;
  for (const auto& camera : cameras_) {
    auto ids = camera->TrackedBookings();
    tracked.insert(tracked.end(), ids.begin(), ids.end());
  }
  if (tracked.empty()) {
    return;
  }

  const auto statuses = source_->FetchStatuses(tracked);
  for (const auto& camera : cameras_) {
    for (const auto& id : camera->TrackedBookings()) {
      auto       it      = statuses.find(id);
      const bool removed = it == statuses.end();
      if (!removed && it->second != model::BookingStatus::kCanceled) {
        continue;
      }

      if (camera->RequestStop(id, true)) {
        ++report.stopped;
        BOOKREC_LOG_INFO("Stopping canceled booking", {StringField("camera_id", camera->camera_id()), StringField("booking_id", id),
                                                       observability::BoolField("removed", removed)});
      }
    }
  }
}

void BookingPoller::MarkFailed(const std::string& booking_id, const std::string& reason) {
  auto result = source_->UpdateStatus(booking_id, model::BookingStatus::kFailed, reason);
  if (!result) {
    // still scheduled at the source, so the next cycle tries again
    BOOKREC_LOG_WARN("Could not mark booking failed", {StringField("booking_id", booking_id), StringField("error", result.message)});
  }
}

void BookingPoller::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&BookingPoller::Run, this);
}

void BookingPoller::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard lock(wait_mutex_);
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void BookingPoller::Run() {
  BOOKREC_LOG_INFO("Booking poller started", {IntField("interval_ms", settings_.poll_interval.count()),
                                              IntField("cameras", static_cast<std::int64_t>(cameras_.size()))});
  while (running_) {
    try {
      PollOnce();
    } catch (const std::exception& e) {
      BOOKREC_LOG_ERROR("Booking poll cycle failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, settings_.poll_interval, [this] { return !running_; });
  }
}

} // namespace bookrec::booking
