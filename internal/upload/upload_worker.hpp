#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "artifact_store.hpp"
#include "internal/backoff/backoff_controller.hpp"
#include "internal/booking/booking_source.hpp"
#include "upload_queue.hpp"

namespace bookrec::upload {

struct UploadSettings {
  std::uint32_t          workers             = 1;
  std::uint32_t          max_attempts        = 3;
  bool                   delete_after_upload = true;
  backoff::BackoffPolicy retry_policy;

  // how long an uploaded task is remembered before it is pruned
  std::chrono::milliseconds uploaded_retention{std::chrono::hours(1)};
};

/*
  Worker pool draining the upload queue.

  Per task:
      Upload(local, booking_id) ok   -> uploaded, catalog row, local file removed
      UploadError                    -> retry after backoff until max_attempts
      PermanentUploadFailure         -> permanently_failed at once

  A permanently failed task keeps its local file for manual recovery.
  Uploaded tasks older than uploaded_retention are pruned between tasks.
*/
class UploadWorkerPool {
 public:
  UploadWorkerPool(UploadSettings settings, std::shared_ptr<UploadQueue> queue, std::shared_ptr<ArtifactStore> store,
                   std::shared_ptr<booking::BookingSource> bookings, std::shared_ptr<util::ClockSource> clock);
  ~UploadWorkerPool();

  void Start();
  void Stop();

  // Processes at most one due task on the calling thread. Returns false when
  // nothing was due.
  bool ProcessOnce();

 private:
  void Run();
  void Process(const model::UploadTask& task);
  void FlushCatalog();
  void Prune();

  UploadSettings                          settings_;
  std::shared_ptr<UploadQueue>            queue_;
  std::shared_ptr<ArtifactStore>          store_;
  std::shared_ptr<booking::BookingSource> bookings_;
  std::shared_ptr<util::ClockSource>      clock_;

  // catalog rows whose write failed, retried before each task
  std::mutex                              catalog_mutex_;
  std::vector<booking::ArtifactRecord>    pending_catalog_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace bookrec::upload
