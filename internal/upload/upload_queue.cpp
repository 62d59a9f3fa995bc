#include "upload_queue.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace bookrec::upload {

namespace {

// manual clocks in tests advance without notifying, so waits re-check often
constexpr std::chrono::milliseconds kRecheckInterval(100);

} // namespace

UploadQueue::UploadQueue(std::size_t capacity, std::shared_ptr<util::ClockSource> clock, std::shared_ptr<UploadTaskStore> store)
    : capacity_(capacity), clock_(std::move(clock)), store_(std::move(store)) {
}

EnqueueOutcome UploadQueue::Enqueue(model::UploadTask task) {
  {
    std::lock_guard lock(mutex_);

    auto it = tasks_.find(task.booking_id);
    if (it != tasks_.end() && it->second.status != model::UploadStatus::kPermanentlyFailed) {
      return EnqueueOutcome::kDuplicate;
    }
    if (ActiveCountLocked() >= capacity_) {
      return EnqueueOutcome::kFull;
    }

    task.status        = model::UploadStatus::kPending;
    task.attempt_count = 0;
    task.finished_at   = util::TimePoint{};
    task.last_error.clear();
    if (task.created_at == util::TimePoint{}) {
      task.created_at = clock_->Now();
    }

    tasks_[task.booking_id] = task;
    Persist(task);
  }
  cv_.notify_one();
  return EnqueueOutcome::kQueued;
}

std::optional<model::UploadTask> UploadQueue::Dequeue(std::chrono::milliseconds max_wait) {
  const auto       deadline = std::chrono::steady_clock::now() + max_wait;
  std::unique_lock lock(mutex_);

  for (;;) {
    if (shutdown_) {
      return std::nullopt;
    }
    if (auto task = TakeDueLocked()) {
      return task;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(kRecheckInterval, deadline - now));
  }
}

std::optional<model::UploadTask> UploadQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (shutdown_) {
    return std::nullopt;
  }
  return TakeDueLocked();
}

std::optional<model::UploadTask> UploadQueue::TakeDueLocked() {
  const auto         now  = clock_->Now();
  model::UploadTask* next = nullptr;

  for (auto& [id, task] : tasks_) {
    if (task.status != model::UploadStatus::kPending || task.not_before > now) {
      continue;
    }
    if (!next || task.not_before < next->not_before) {
      next = &task;
    }
  }
  if (!next) {
    return std::nullopt;
  }

  next->status = model::UploadStatus::kUploading;
  Persist(*next);
  return *next;
}

void UploadQueue::MarkUploaded(const std::string& booking_id, const std::string& remote_url) {
  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(booking_id);
  if (it == tasks_.end()) {
    return;
  }

  it->second.status      = model::UploadStatus::kUploaded;
  it->second.remote_url  = remote_url;
  it->second.finished_at = clock_->Now();
  it->second.last_error.clear();
  Persist(it->second);
}

void UploadQueue::Retry(const std::string& booking_id, const std::string& error, util::TimePoint not_before) {
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(booking_id);
    if (it == tasks_.end()) {
      return;
    }

    ++it->second.attempt_count;
    it->second.status     = model::UploadStatus::kPending;
    it->second.not_before = not_before;
    it->second.last_error = error;
    Persist(it->second);
  }
  cv_.notify_one();
}

void UploadQueue::MarkPermanentlyFailed(const std::string& booking_id, const std::string& error) {
  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(booking_id);
  if (it == tasks_.end()) {
    return;
  }

  ++it->second.attempt_count;
  it->second.status      = model::UploadStatus::kPermanentlyFailed;
  it->second.last_error  = error;
  it->second.finished_at = clock_->Now();
  Persist(it->second);
}

UploadCounts UploadQueue::CountsFor(const std::string& camera_id) const {
  std::lock_guard lock(mutex_);
  UploadCounts    counts;

  for (const auto& [id, task] : tasks_) {
    if (task.camera_id != camera_id) {
      continue;
    }
    if (task.status == model::UploadStatus::kPending || task.status == model::UploadStatus::kUploading) {
      ++counts.pending;
    } else if (task.status == model::UploadStatus::kPermanentlyFailed) {
      ++counts.failed;
      counts.failed_bookings.push_back(id);
    }
  }
  return counts;
}

std::optional<model::UploadTask> UploadQueue::Find(const std::string& booking_id) const {
  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(booking_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool UploadQueue::HasActive() const {
  std::lock_guard lock(mutex_);
  return ActiveCountLocked() > 0;
}

std::size_t UploadQueue::PruneUploaded(util::TimePoint cutoff) {
  std::lock_guard lock(mutex_);
  std::size_t     removed = 0;

  for (auto it = tasks_.begin(); it != tasks_.end();) {
    const auto& task = it->second;
    if (task.status != model::UploadStatus::kUploaded || task.finished_at > cutoff) {
      ++it;
      continue;
    }

    if (store_) {
      if (auto result = store_->Delete(task.booking_id); !result) {
        // keep the row and the entry together; retried on the next prune
        BOOKREC_LOG_WARN("Upload task delete failed", {observability::StringField("booking_id", task.booking_id),
                                                       observability::StringField("error", result.message)});
        ++it;
        continue;
      }
    }
    it = tasks_.erase(it);
    ++removed;
  }
  return removed;
}

std::size_t UploadQueue::Hydrate() {
  if (!store_) {
    return 0;
  }

  auto            loaded = store_->LoadAll();
  std::size_t     count  = 0;
  {
    std::lock_guard lock(mutex_);
    for (auto& task : loaded) {
      if (task.status == model::UploadStatus::kUploading) {
        task.status = model::UploadStatus::kPending;
        Persist(task);
      }
      tasks_[task.booking_id] = std::move(task);
      ++count;
    }
  }
  cv_.notify_all();

  BOOKREC_LOG_INFO("Upload tasks hydrated", {observability::IntField("tasks", static_cast<std::int64_t>(count))});
  return count;
}

void UploadQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t UploadQueue::ActiveCountLocked() const {
  return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto& entry) { return !model::IsTerminal(entry.second.status); }));
}

void UploadQueue::Persist(const model::UploadTask& task) {
  if (!store_) {
    return;
  }

  auto result = store_->Upsert(task);
  if (!result) {
    // the in-memory queue stays authoritative; the next state change writes again
    BOOKREC_LOG_WARN("Upload task persist failed", {observability::StringField("booking_id", task.booking_id),
                                                    observability::StringField("status", model::ToString(task.status)),
                                                    observability::StringField("error", result.message)});
  }
}

} // namespace bookrec::upload
