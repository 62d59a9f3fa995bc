#include "status_reporter.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace bookrec::status {

using observability::StringField;

std::uint64_t DirectorySize(const std::filesystem::path& dir) {
  std::uint64_t   total = 0;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return 0;
  }

  for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec)) {
      const auto size = it->file_size(entry_ec);
      if (!entry_ec) total += size;
    }
  }
  return total;
}

bookrec::v1::CameraState ToProto(camera::LifecycleState state) {
  switch (state) {
    case camera::LifecycleState::kIdle:
      return bookrec::v1::CAMERA_STATE_IDLE;
    case camera::LifecycleState::kInitializing:
      return bookrec::v1::CAMERA_STATE_INITIALIZING;
    case camera::LifecycleState::kRecording:
      return bookrec::v1::CAMERA_STATE_RECORDING;
    case camera::LifecycleState::kFinalizing:
      return bookrec::v1::CAMERA_STATE_FINALIZING;
    case camera::LifecycleState::kFailed:
      return bookrec::v1::CAMERA_STATE_FAILED;
  }
  return bookrec::v1::CAMERA_STATE_UNSPECIFIED;
}

StatusReporter::StatusReporter(ReporterSettings settings, std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras,
                               std::shared_ptr<upload::UploadQueue> uploads, std::shared_ptr<StatusSink> sink,
                               std::shared_ptr<util::ClockSource> clock)
    : settings_(std::move(settings)), cameras_(std::move(cameras)), uploads_(std::move(uploads)), sink_(std::move(sink)), clock_(std::move(clock)) {
}

StatusReporter::~StatusReporter() {
  Stop();
}

bookrec::v1::CameraStatus StatusReporter::Build(const camera::CameraLifecycle& camera, util::TimePoint now) const {
  const auto snapshot = camera.Snapshot();
  const auto counts   = uploads_->CountsFor(snapshot.camera_id);

  bookrec::v1::CameraStatus status;
  status.set_camera_id(snapshot.camera_id);
  status.set_node_id(settings_.node_id);
  status.set_user_id(settings_.user_id);
  status.set_is_recording(snapshot.is_recording);
  status.set_state(ToProto(snapshot.state));
  status.set_active_booking_id(snapshot.active_booking_id);
  status.set_consecutive_failures(snapshot.consecutive_failures);
  if (snapshot.next_retry_at) {
    *status.mutable_next_retry_at() = util::ToProto(*snapshot.next_retry_at);
  }
  status.set_recording_errors(snapshot.recording_errors);
  status.set_last_error(snapshot.last_error);
  status.set_pending_uploads(static_cast<std::uint32_t>(counts.pending));
  status.set_failed_uploads(static_cast<std::uint32_t>(counts.failed));
  for (const auto& id : counts.failed_bookings) {
    status.add_failed_upload_bookings(id);
  }
  status.set_storage_used_bytes(DirectorySize(settings_.recordings_dir / snapshot.camera_id));
  *status.mutable_last_heartbeat() = util::ToProto(now);
  return status;
}

bookrec::v1::NodeStatus StatusReporter::Collect() const {
  const auto now = clock_->Now();

  bookrec::v1::NodeStatus node;
  node.set_node_id(settings_.node_id);
  for (const auto& camera : cameras_) {
    *node.add_cameras() = Build(*camera, now);
  }
  *node.mutable_taken_at() = util::ToProto(now);
  return node;
}

std::optional<bookrec::v1::CameraStatus> StatusReporter::CollectCamera(const std::string& camera_id) const {
  for (const auto& camera : cameras_) {
    if (camera->camera_id() == camera_id) {
      return Build(*camera, clock_->Now());
    }
  }
  return std::nullopt;
}

bool StatusReporter::ReportOnce() {
  observability::SpanScope span("status.report");
  const auto               node = Collect();

  bool all_written = true;
  for (const auto& status : node.cameras()) {
    observability::Metrics::Instance().SetPendingUploads(status.camera_id(), status.pending_uploads());

    auto result = sink_->Write(status.camera_id(), status);
    if (!result) {
      all_written = false;
      span.RecordException(result.message);
      BOOKREC_LOG_WARN("Status write failed", {StringField("camera_id", status.camera_id()), StringField("error", result.message)});
    }
  }
  return all_written;
}

void StatusReporter::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&StatusReporter::Run, this);
}

void StatusReporter::Stop() {
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

void StatusReporter::Run() {
  while (running_) {
    try {
      ReportOnce();
    } catch (const std::exception& e) {
      BOOKREC_LOG_ERROR("Status report failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, settings_.heartbeat_interval, [this] { return !running_; });
  }
}

} // namespace bookrec::status
