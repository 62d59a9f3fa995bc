#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/upload_task.hpp"
#include "internal/util/time.hpp"
#include "upload_task_store.hpp"

namespace bookrec::upload {

enum class EnqueueOutcome {
  kQueued,
  kDuplicate, // a pending, uploading or uploaded task already exists for the booking
  kFull,      // retry later
};

struct UploadCounts {
  std::uint64_t            pending = 0; // pending + uploading
  std::uint64_t            failed  = 0;
  std::vector<std::string> failed_bookings;
};

/*
  Thread-safe upload queue shared by the camera lifecycles (producers) and
  the upload workers (consumers).

  Tasks are keyed by booking_id and stay in the queue after they reach a
  terminal state, which is what makes Enqueue idempotent. Capacity bounds
  only the non-terminal tasks. Uploaded tasks are dropped by PruneUploaded()
  once they are older than the retention window; the remote store merges a
  repeated key, so a late duplicate still yields one artifact.
  Permanently failed tasks are kept until an operator re-enqueues them.

  A task is handed out only once its not_before has passed on the injected
  clock.
*/
class UploadQueue {
 public:
  UploadQueue(std::size_t capacity, std::shared_ptr<util::ClockSource> clock, std::shared_ptr<UploadTaskStore> store = nullptr);

  EnqueueOutcome Enqueue(model::UploadTask task);

  // Blocks up to max_wait for a due task; nullopt on timeout or shutdown.
  // The returned task is already marked uploading.
  std::optional<model::UploadTask> Dequeue(std::chrono::milliseconds max_wait);
  std::optional<model::UploadTask> TryDequeue();

  void MarkUploaded(const std::string& booking_id, const std::string& remote_url);
  void Retry(const std::string& booking_id, const std::string& error, util::TimePoint not_before);
  void MarkPermanentlyFailed(const std::string& booking_id, const std::string& error);

  UploadCounts                     CountsFor(const std::string& camera_id) const;
  std::optional<model::UploadTask> Find(const std::string& booking_id) const;
  bool                             HasActive() const;

  // Removes uploaded tasks finished at or before cutoff, from memory and
  // the store. Returns the number removed.
  std::size_t PruneUploaded(util::TimePoint cutoff);

  // Loads persisted tasks; tasks caught mid-upload go back to pending.
  std::size_t Hydrate();

  void Shutdown();

 private:
  std::optional<model::UploadTask> TakeDueLocked();
  std::size_t                      ActiveCountLocked() const;
  void                             Persist(const model::UploadTask& task);

  std::size_t                        capacity_;
  std::shared_ptr<util::ClockSource> clock_;
  std::shared_ptr<UploadTaskStore>   store_;

  mutable std::mutex                       mutex_;
  std::condition_variable                  cv_;
  std::map<std::string, model::UploadTask> tasks_;
  bool                                     shutdown_ = false;
};

} // namespace bookrec::upload
