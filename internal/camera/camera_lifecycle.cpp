#include "camera_lifecycle.hpp"

#include "artifact_naming.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace bookrec::camera {

using observability::IntField;
using observability::StringField;

CameraLifecycle::CameraLifecycle(CameraSettings settings, std::shared_ptr<CameraDriver> driver, std::shared_ptr<booking::BookingSource> bookings,
                                 std::shared_ptr<upload::UploadQueue> uploads, backoff::BackoffPolicy policy,
                                 std::shared_ptr<util::ClockSource> clock)
    : settings_(std::move(settings)),
      driver_(std::move(driver)),
      bookings_(std::move(bookings)),
      uploads_(std::move(uploads)),
      clock_(std::move(clock)),
      backoff_(policy) {
}

CameraLifecycle::~CameraLifecycle() {
  Stop();
}

// ------------------------------------------------------------------
// Mailbox
// ------------------------------------------------------------------

OfferOutcome CameraLifecycle::Offer(const model::Booking& booking) {
  {
    std::lock_guard lock(mutex_);

    if ((session_ && session_->booking.id == booking.id) || (pending_ && pending_->id == booking.id) || unsettled_.count(booking.id)) {
      return OfferOutcome::kAlreadyTracked;
    }
    if (session_ && model::Overlaps(session_->booking, booking)) {
      throw util::ResourceConflictError("booking " + booking.id + " overlaps active booking " + session_->booking.id + " on camera " +
                                        settings_.camera_id);
    }
    if (pending_ && model::Overlaps(*pending_, booking)) {
      throw util::ResourceConflictError("booking " + booking.id + " overlaps pending booking " + pending_->id + " on camera " +
                                        settings_.camera_id);
    }
    if (session_ || pending_) {
      return OfferOutcome::kBusy;
    }

    pending_ = booking;
  }

  BOOKREC_LOG_INFO("Booking accepted", {StringField("camera_id", settings_.camera_id), StringField("booking_id", booking.id),
                                        StringField("start", booking.start_text), StringField("end", booking.end_text)});
  Wake();
  return OfferOutcome::kAccepted;
}

bool CameraLifecycle::RequestStop(const std::string& booking_id, bool canceled) {
  {
    std::lock_guard lock(mutex_);
    const bool      tracked = (session_ && session_->booking.id == booking_id) || (pending_ && pending_->id == booking_id);
    if (!tracked) {
      return false;
    }
    stop_requests_[booking_id] = canceled;
  }
  Wake();
  return true;
}

// ------------------------------------------------------------------
// Tick
// ------------------------------------------------------------------

void CameraLifecycle::Tick() {
  std::lock_guard                 tick_lock(tick_mutex_);
  observability::ScopedLogContext log_context({StringField("camera_id", settings_.camera_id)});
  FlushOutbox();

  const auto       now = clock_->Now();
  std::unique_lock lock(mutex_);

  if (state_ == LifecycleState::kFailed) {
    state_ = LifecycleState::kIdle;
  }

  if (session_) {
    auto       request  = stop_requests_.find(session_->booking.id);
    const bool canceled = request != stop_requests_.end() && request->second;
    const bool retrying = state_ == LifecycleState::kFinalizing;
    if (!retrying && request == stop_requests_.end() && now < session_->booking.end) {
      return;
    }

    const auto session = *session_;
    state_             = LifecycleState::kFinalizing;
    lock.unlock();

    if (!Finalize(session, canceled)) {
      BOOKREC_LOG_INFO("Finalize deferred to next tick", {StringField("booking_id", session.booking.id)});
    }
    return;
  }

  if (!pending_) {
    return;
  }

  if (auto request = stop_requests_.find(pending_->id); request != stop_requests_.end()) {
    // canceled before it started; the source already holds the final status
    const auto id = pending_->id;
    pending_.reset();
    stop_requests_.erase(request);
    lock.unlock();

    BOOKREC_LOG_INFO("Pending booking withdrawn", {StringField("camera_id", settings_.camera_id), StringField("booking_id", id)});
    return;
  }

  if (now >= pending_->end) {
    const auto id = pending_->id;
    pending_.reset();
    ++unsettled_[id];
    lock.unlock();

    BOOKREC_LOG_WARN("Booking window elapsed before recording started",
                     {StringField("camera_id", settings_.camera_id), StringField("booking_id", id)});
    QueueStatus(id, model::BookingStatus::kFailed, "window elapsed before the camera could start");
    return;
  }

  if (now < pending_->start || !backoff_.MayAttempt(now)) {
    return;
  }

  const auto booking = *pending_;
  state_             = LifecycleState::kInitializing;
  lock.unlock();

  Initialize(booking, now);
}

void CameraLifecycle::Initialize(const model::Booking& booking, util::TimePoint now) {
  observability::ScopedLogContext log_context({StringField("booking_id", booking.id)});
  observability::SpanScope        span("camera.initialize");
  span.SetAttribute("camera_id", settings_.camera_id);
  span.SetAttribute("booking_id", booking.id);

  std::filesystem::path path;
  DriverResult          result;
  try {
    path = ArtifactPath(settings_.recordings_dir, settings_.camera_id, booking.id, now);
  } catch (const std::invalid_argument& e) {
    result = DriverResult::Err(DriverCode::kInternal, e.what());
  }

  std::vector<std::uint8_t> frame;
  if (result) result = driver_->Open();
  if (result) result = driver_->Configure(settings_.format);
  if (result) result = driver_->Start(path);
  if (result) result = driver_->CaptureTestFrame(frame);

  if (!result) {
    span.RecordException(result.Describe());
    const bool released = ReleaseDriver();

    std::error_code ec;
    if (!path.empty()) std::filesystem::remove(path, ec);

    bool                      elapsed = false;
    std::chrono::milliseconds delay{};
    std::uint32_t             failures = 0;
    {
      std::lock_guard lock(mutex_);
      delay    = backoff_.RecordFailure(clock_->Now());
      failures = backoff_.consecutive_failures();
      ++recording_errors_;
      last_error_ = result.Describe();
      state_      = LifecycleState::kFailed;

      elapsed = clock_->Now() >= booking.end;
      if (elapsed) {
        pending_.reset();
        ++unsettled_[booking.id];
      }
    }

    observability::Metrics::Instance().RecordCameraInit(settings_.camera_id, false);
    BOOKREC_LOG_WARN("Camera initialization failed",
                     {StringField("camera_id", settings_.camera_id), StringField("booking_id", booking.id),
                      StringField("error", result.Describe()), IntField("consecutive_failures", failures),
                      IntField("retry_in_ms", delay.count()), observability::BoolField("released", released)});

    if (elapsed) {
      QueueStatus(booking.id, model::BookingStatus::kFailed, "camera initialization failed: " + result.Describe());
    }
    return;
  }

  // a slow Open() or test frame can use up the whole window
  if (const auto after = clock_->Now(); after >= booking.end) {
    const bool released = ReleaseDriver();

    std::error_code ec;
    std::filesystem::remove(path, ec);
    {
      std::lock_guard lock(mutex_);
      backoff_.RecordSuccess();
      ++recording_errors_;
      last_error_ = "window elapsed during initialization";
      pending_.reset();
      state_ = LifecycleState::kFailed;
      ++unsettled_[booking.id];
    }

    observability::Metrics::Instance().RecordCameraInit(settings_.camera_id, true);
    BOOKREC_LOG_WARN("Booking window elapsed during camera initialization",
                     {StringField("camera_id", settings_.camera_id), StringField("booking_id", booking.id),
                      StringField("end", booking.end_text), observability::BoolField("released", released)});
    QueueStatus(booking.id, model::BookingStatus::kFailed, "window elapsed during initialization");
    return;
  }

  {
    std::lock_guard lock(mutex_);
    backoff_.RecordSuccess();
    session_ = RecordingSession{booking, now, path};
    pending_.reset();
    state_ = LifecycleState::kRecording;
  }

  observability::Metrics::Instance().RecordCameraInit(settings_.camera_id, true);
  BOOKREC_LOG_INFO("Recording started", {StringField("camera_id", settings_.camera_id), StringField("booking_id", booking.id),
                                         StringField("artifact", path.string()), IntField("test_frame_bytes", static_cast<std::int64_t>(frame.size()))});
  WriteStatus(booking.id, model::BookingStatus::kRecording, "");
}

bool CameraLifecycle::Finalize(const RecordingSession& session, bool canceled) {
  observability::ScopedLogContext log_context({StringField("booking_id", session.booking.id)});
  observability::SpanScope        span("camera.finalize");
  span.SetAttribute("camera_id", settings_.camera_id);
  span.SetAttribute("booking_id", session.booking.id);

  if (!ReleaseDriver()) {
    std::uint32_t attempts = 0;
    {
      std::lock_guard lock(mutex_);
      attempts    = ++release_failures_;
      last_error_ = "camera did not release recording " + session.artifact_path.string();
      if (attempts >= kMaxReleaseAttempts) {
        release_failures_ = 0;
        ++recording_errors_;
        session_.reset();
        stop_requests_.erase(session.booking.id);
        state_ = LifecycleState::kFailed;
        if (!canceled) ++unsettled_[session.booking.id];
      }
    }

    if (attempts < kMaxReleaseAttempts) {
      span.RecordException("release failed");
      BOOKREC_LOG_WARN("Recording release failed, will retry",
                       {StringField("camera_id", settings_.camera_id), StringField("booking_id", session.booking.id),
                        IntField("attempt", attempts), IntField("max_attempts", kMaxReleaseAttempts)});
      return false;
    }

    // the file may still be open for writing; it stays on disk and is not uploaded
    BOOKREC_LOG_ERROR("Recording abandoned, camera did not release it",
                      {StringField("camera_id", settings_.camera_id), StringField("booking_id", session.booking.id),
                       StringField("artifact", session.artifact_path.string()), IntField("attempts", attempts)});
    if (!canceled) {
      QueueStatus(session.booking.id, model::BookingStatus::kFailed, "camera did not release the recording");
    }
    return true;
  }

  std::error_code ec;
  const bool      have_artifact = std::filesystem::is_regular_file(session.artifact_path, ec);

  if (have_artifact) {
    model::UploadTask task;
    task.booking_id    = session.booking.id;
    task.camera_id     = settings_.camera_id;
    task.user_id       = session.booking.user_id;
    task.artifact_path = session.artifact_path.string();
    task.created_at    = clock_->Now();
    HandOff(std::move(task));
  }

  {
    std::lock_guard lock(mutex_);
    if (!have_artifact) {
      ++recording_errors_;
      last_error_ = "artifact missing after finalize: " + session.artifact_path.string();
    }
    release_failures_ = 0;
    session_.reset();
    stop_requests_.erase(session.booking.id);
    state_ = LifecycleState::kIdle;
    if (!canceled) ++unsettled_[session.booking.id];
  }

  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(clock_->Now() - session.started_at).count();
  BOOKREC_LOG_INFO("Recording finalized", {StringField("camera_id", settings_.camera_id), StringField("booking_id", session.booking.id),
                                           IntField("duration_s", seconds), observability::BoolField("canceled", canceled),
                                           observability::BoolField("artifact", have_artifact)});

  if (canceled) {
    return true;
  }
  if (have_artifact) {
    QueueStatus(session.booking.id, model::BookingStatus::kCompleted, "");
  } else {
    QueueStatus(session.booking.id, model::BookingStatus::kFailed, "recording produced no artifact");
  }
  return true;
}

bool CameraLifecycle::ReleaseDriver() {
  auto stopped = driver_->Stop();
  if (!stopped) {
    BOOKREC_LOG_WARN("Camera stop failed", {StringField("error", stopped.Describe())});
  }
  auto closed = driver_->Close();
  if (!closed) {
    BOOKREC_LOG_WARN("Camera close failed", {StringField("error", closed.Describe())});
  }
  return stopped && closed;
}

// ------------------------------------------------------------------
// Outbox
// ------------------------------------------------------------------

void CameraLifecycle::WriteStatus(const std::string& booking_id, model::BookingStatus status, const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    ++unsettled_[booking_id];
  }
  QueueStatus(booking_id, status, reason);
}

void CameraLifecycle::QueueStatus(const std::string& booking_id, model::BookingStatus status, const std::string& reason) {
  pending_writes_.push_back({booking_id, status, reason});
  FlushOutbox();
}

void CameraLifecycle::HandOff(model::UploadTask task) {
  pending_uploads_.push_back(std::move(task));
  FlushOutbox();
}

void CameraLifecycle::FlushOutbox() {
  // status writes stay in order: a late "recording" must never follow "completed"
  while (!pending_writes_.empty()) {
    const auto& write  = pending_writes_.front();
    auto        result = bookings_->UpdateStatus(write.booking_id, write.status, write.reason);
    if (!result && result.Retryable()) {
      BOOKREC_LOG_WARN("Booking status write deferred",
                       {StringField("booking_id", write.booking_id), StringField("status", model::ToString(write.status)),
                        StringField("error", result.message)});
      break;
    }
    if (!result) {
      BOOKREC_LOG_WARN("Booking status write rejected",
                       {StringField("booking_id", write.booking_id), StringField("status", model::ToString(write.status)),
                        StringField("error", result.message)});
    }
    {
      std::lock_guard lock(mutex_);
      if (auto it = unsettled_.find(write.booking_id); it != unsettled_.end() && --it->second == 0) {
        unsettled_.erase(it);
      }
    }
    pending_writes_.pop_front();
  }

  while (!pending_uploads_.empty()) {
    const auto& task    = pending_uploads_.front();
    const auto  outcome = uploads_->Enqueue(task);
    if (outcome == upload::EnqueueOutcome::kFull) {
      BOOKREC_LOG_WARN("Upload queue full, hand-off deferred", {StringField("booking_id", task.booking_id)});
      break;
    }
    pending_uploads_.pop_front();
  }
}

// ------------------------------------------------------------------
// Thread
// ------------------------------------------------------------------

void CameraLifecycle::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&CameraLifecycle::Run, this);
}

void CameraLifecycle::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  Wake();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void CameraLifecycle::Run() {
  while (running_) {
    try {
      Tick();
    } catch (const std::exception& e) {
      std::lock_guard lock(mutex_);
      last_error_ = e.what();
      BOOKREC_LOG_ERROR("Camera tick failed", {StringField("camera_id", settings_.camera_id), StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_.wait_for(lock, settings_.tick_interval, [this] { return !running_ || wake_requested_; });
    wake_requested_ = false;
  }
}

void CameraLifecycle::Wake() {
  {
    std::lock_guard lock(wake_mutex_);
    wake_requested_ = true;
  }
  wake_.notify_all();
}

void CameraLifecycle::Shutdown() {
  std::lock_guard                 tick_lock(tick_mutex_);
  observability::ScopedLogContext log_context({StringField("camera_id", settings_.camera_id)});

  std::optional<RecordingSession> session;
  {
    std::lock_guard lock(mutex_);
    if (session_) {
      session = session_;
      state_  = LifecycleState::kFinalizing;
    }
  }

  if (session) {
    BOOKREC_LOG_INFO("Finalizing recording for shutdown",
                     {StringField("camera_id", settings_.camera_id), StringField("booking_id", session->booking.id)});
    bool canceled = false;
    {
      std::lock_guard lock(mutex_);
      if (auto request = stop_requests_.find(session->booking.id); request != stop_requests_.end()) canceled = request->second;
    }
    // bounded by kMaxReleaseAttempts
    while (!Finalize(*session, canceled)) {
      std::this_thread::sleep_for(settings_.tick_interval);
    }
  }
  FlushOutbox();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

CameraSnapshot CameraLifecycle::Snapshot() const {
  std::lock_guard lock(mutex_);

  CameraSnapshot snapshot;
  snapshot.camera_id            = settings_.camera_id;
  snapshot.state                = state_;
  snapshot.is_recording         = session_.has_value();
  snapshot.active_booking_id    = session_ ? session_->booking.id : std::string{};
  snapshot.pending_booking_id   = pending_ ? pending_->id : std::string{};
  snapshot.consecutive_failures = backoff_.consecutive_failures();
  snapshot.next_retry_at        = backoff_.next_retry_at();
  snapshot.recording_errors     = recording_errors_;
  snapshot.last_error           = last_error_;
  return snapshot;
}

std::vector<std::string> CameraLifecycle::TrackedBookings() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> ids;
  if (session_) ids.push_back(session_->booking.id);
  if (pending_) ids.push_back(pending_->id);
  return ids;
}

bool CameraLifecycle::IsTracking(const std::string& booking_id) const {
  std::lock_guard lock(mutex_);
  return (session_ && session_->booking.id == booking_id) || (pending_ && pending_->id == booking_id) || unsettled_.count(booking_id) > 0;
}

} // namespace bookrec::camera
