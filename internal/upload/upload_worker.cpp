#include "upload_worker.hpp"

#include <absl/time/time.h>

#include <filesystem>

#include "internal/camera/artifact_naming.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace bookrec::upload {

namespace {

constexpr std::chrono::milliseconds kDequeueWait(500);

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

std::string StartedAt(const model::UploadTask& task) {
  if (auto name = camera::ParseArtifactPath(task.artifact_path)) {
    return absl::FormatTime(absl::RFC3339_sec, absl::FromChrono(name->started_at), absl::UTCTimeZone());
  }
  return {};
}

} // namespace

UploadWorkerPool::UploadWorkerPool(UploadSettings settings, std::shared_ptr<UploadQueue> queue, std::shared_ptr<ArtifactStore> store,
                                   std::shared_ptr<booking::BookingSource> bookings, std::shared_ptr<util::ClockSource> clock)
    : settings_(settings), queue_(std::move(queue)), store_(std::move(store)), bookings_(std::move(bookings)), clock_(std::move(clock)) {
}

UploadWorkerPool::~UploadWorkerPool() {
  Stop();
}

void UploadWorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }

  const auto workers = settings_.workers == 0 ? 1u : settings_.workers;
  for (std::uint32_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&UploadWorkerPool::Run, this);
  }
  BOOKREC_LOG_INFO("Upload workers started", {observability::IntField("workers", workers)});
}

void UploadWorkerPool::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool UploadWorkerPool::ProcessOnce() {
  FlushCatalog();
  Prune();

  auto task = queue_->TryDequeue();
  if (!task) {
    return false;
  }
  Process(*task);
  return true;
}

void UploadWorkerPool::Run() {
  while (running_) {
    FlushCatalog();
    Prune();

    auto task = queue_->Dequeue(kDequeueWait);
    if (!task) {
      continue;
    }
    Process(*task);
  }
}

void UploadWorkerPool::Process(const model::UploadTask& task) {
  observability::ScopedLogContext log_context(
      {observability::StringField("booking_id", task.booking_id), observability::StringField("camera_id", task.camera_id)});
  observability::SpanScope span("upload.artifact");
  span.SetAttribute("booking_id", task.booking_id);
  span.SetAttribute("camera_id", task.camera_id);
  span.SetAttribute("attempt", static_cast<std::int64_t>(task.attempt_count + 1));

  const auto started = std::chrono::steady_clock::now();

  std::error_code ec;
  const auto      size = std::filesystem::file_size(task.artifact_path, ec);

  try {
    const auto url = store_->Upload(task.artifact_path, task.booking_id);
    queue_->MarkUploaded(task.booking_id, url);
    observability::Metrics::Instance().ObserveUploadDurationMs("uploaded", ElapsedMs(started));

    BOOKREC_LOG_INFO("Artifact uploaded", {observability::StringField("booking_id", task.booking_id),
                                           observability::StringField("camera_id", task.camera_id), observability::StringField("url", url),
                                           observability::IntField("attempt", task.attempt_count + 1)});

    booking::ArtifactRecord record;
    record.booking_id = task.booking_id;
    record.camera_id  = task.camera_id;
    record.user_id    = task.user_id;
    record.local_path = task.artifact_path;
    record.remote_url = url;
    record.size_bytes = ec ? 0 : static_cast<std::uint64_t>(size);
    record.started_at = StartedAt(task);

    if (auto result = bookings_->RecordArtifact(record); !result) {
      BOOKREC_LOG_WARN("Artifact catalog write failed", {observability::StringField("booking_id", task.booking_id),
                                                         observability::StringField("error", result.message)});
      if (result.Retryable()) {
        std::lock_guard lock(catalog_mutex_);
        pending_catalog_.push_back(record);
      }
    }

    if (settings_.delete_after_upload) {
      std::filesystem::remove(task.artifact_path, ec);
      if (ec) {
        BOOKREC_LOG_WARN("Uploaded artifact could not be removed",
                         {observability::StringField("path", task.artifact_path), observability::StringField("error", ec.message())});
      }
    }
  } catch (const util::PermanentUploadFailure& e) {
    span.RecordException(e.what());
    queue_->MarkPermanentlyFailed(task.booking_id, e.what());
    observability::Metrics::Instance().ObserveUploadDurationMs("permanently_failed", ElapsedMs(started));
    BOOKREC_LOG_ERROR("Artifact upload failed permanently", {observability::StringField("booking_id", task.booking_id),
                                                             observability::StringField("path", task.artifact_path),
                                                             observability::StringField("error", e.what())});
  } catch (const util::UploadError& e) {
    span.RecordException(e.what());
    const auto attempts = task.attempt_count + 1;

    if (attempts >= settings_.max_attempts) {
      queue_->MarkPermanentlyFailed(task.booking_id, e.what());
      observability::Metrics::Instance().ObserveUploadDurationMs("permanently_failed", ElapsedMs(started));
      BOOKREC_LOG_ERROR("Artifact upload exhausted retries", {observability::StringField("booking_id", task.booking_id),
                                                              observability::StringField("path", task.artifact_path),
                                                              observability::IntField("attempts", attempts),
                                                              observability::StringField("error", e.what())});
      return;
    }

    const auto delay = backoff::ComputeBackoffDelay(attempts, settings_.retry_policy);
    queue_->Retry(task.booking_id, e.what(), clock_->Now() + delay);
    observability::Metrics::Instance().ObserveUploadDurationMs("retry", ElapsedMs(started));
    BOOKREC_LOG_WARN("Artifact upload failed, will retry", {observability::StringField("booking_id", task.booking_id),
                                                            observability::IntField("attempts", attempts),
                                                            observability::IntField("retry_in_ms", delay.count()),
                                                            observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    // anything else from the store is treated as retryable
    span.RecordException(e.what());
    const auto attempts = task.attempt_count + 1;
    if (attempts >= settings_.max_attempts) {
      queue_->MarkPermanentlyFailed(task.booking_id, e.what());
    } else {
      queue_->Retry(task.booking_id, e.what(), clock_->Now() + backoff::ComputeBackoffDelay(attempts, settings_.retry_policy));
    }
    BOOKREC_LOG_ERROR("Artifact upload raised unexpected error",
                      {observability::StringField("booking_id", task.booking_id), observability::StringField("error", e.what())});
  }
}

void UploadWorkerPool::Prune() {
  const auto removed = queue_->PruneUploaded(clock_->Now() - settings_.uploaded_retention);
  if (removed > 0) {
    BOOKREC_LOG_INFO("Uploaded tasks pruned", {observability::IntField("tasks", static_cast<std::int64_t>(removed))});
  }
}

void UploadWorkerPool::FlushCatalog() {
  std::vector<booking::ArtifactRecord> pending;
  {
    std::lock_guard lock(catalog_mutex_);
    pending.swap(pending_catalog_);
  }

  std::vector<booking::ArtifactRecord> still_pending;
  for (auto& record : pending) {
    auto result = bookings_->RecordArtifact(record);
    if (!result && result.Retryable()) {
      still_pending.push_back(std::move(record));
    }
  }

  if (!still_pending.empty()) {
    std::lock_guard lock(catalog_mutex_);
    pending_catalog_.insert(pending_catalog_.end(), std::make_move_iterator(still_pending.begin()), std::make_move_iterator(still_pending.end()));
  }
}

} // namespace bookrec::upload
