#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/booking/memory_booking_source.hpp"
#include "internal/camera/artifact_naming.hpp"
#include "internal/upload/orphan_recovery.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/upload/upload_worker.hpp"
#include "support/fake_artifact_store.hpp"
#include "support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using bookrec::model::UploadStatus;
using bookrec::upload::EnqueueOutcome;
using bookrec::upload::UploadQueue;

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "booking_recorder_upload_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path WriteArtifact(const std::filesystem::path& dir, const std::string& camera_id, const std::string& booking_id) {
  const auto path = bookrec::camera::ArtifactPath(dir, camera_id, booking_id, bookrec::test::ReferenceInstant());
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << "0123456789";
  return path;
}

bookrec::model::UploadTask Task(const std::string& booking_id, const std::filesystem::path& path) {
  bookrec::model::UploadTask task;
  task.booking_id    = booking_id;
  task.camera_id     = "cam-front";
  task.user_id       = "studio-a";
  task.artifact_path = path.string();
  return task;
}

struct Pipeline {
  std::shared_ptr<bookrec::test::ManualClock>            clock;
  std::shared_ptr<UploadQueue>                           queue;
  std::shared_ptr<bookrec::test::FakeArtifactStore>      store;
  std::shared_ptr<bookrec::booking::MemoryBookingSource> bookings;
  std::unique_ptr<bookrec::upload::UploadWorkerPool>     workers;
};

Pipeline MakePipeline(std::size_t capacity = 8, bool delete_after_upload = true) {
  Pipeline p;
  p.clock    = std::make_shared<bookrec::test::ManualClock>(bookrec::test::ReferenceInstant());
  p.queue    = std::make_shared<UploadQueue>(capacity, p.clock);
  p.store    = std::make_shared<bookrec::test::FakeArtifactStore>();
  p.bookings = std::make_shared<bookrec::booking::MemoryBookingSource>();

  bookrec::upload::UploadSettings settings;
  settings.max_attempts               = 3;
  settings.delete_after_upload        = delete_after_upload;
  settings.retry_policy.initial_delay = 1s;
  settings.retry_policy.max_delay     = 4s;
  p.workers = std::make_unique<bookrec::upload::UploadWorkerPool>(settings, p.queue, p.store, p.bookings, p.clock);
  return p;
}

void TestEnqueueIsIdempotentPerBooking() {
  auto       p    = MakePipeline();
  const auto path = WriteArtifact(TestDir("idempotent"), "cam-front", "b-1");

  assert(p.queue->Enqueue(Task("b-1", path)) == EnqueueOutcome::kQueued);
  assert(p.queue->Enqueue(Task("b-1", path)) == EnqueueOutcome::kDuplicate);
  assert(p.queue->CountsFor("cam-front").pending == 1);

  assert(p.workers->ProcessOnce());
  assert(p.queue->Find("b-1")->status == UploadStatus::kUploaded);

  // uploaded stays uploaded
  assert(p.queue->Enqueue(Task("b-1", path)) == EnqueueOutcome::kDuplicate);
  assert(p.store->object_count() == 1);
}

void TestCapacityCountsOnlyActiveTasks() {
  auto       p   = MakePipeline(1);
  const auto dir = TestDir("capacity");

  assert(p.queue->Enqueue(Task("b-1", WriteArtifact(dir, "cam-front", "b-1"))) == EnqueueOutcome::kQueued);
  assert(p.queue->Enqueue(Task("b-2", WriteArtifact(dir, "cam-front", "b-2"))) == EnqueueOutcome::kFull);

  assert(p.workers->ProcessOnce());
  assert(p.queue->Enqueue(Task("b-2", WriteArtifact(dir, "cam-front", "b-2"))) == EnqueueOutcome::kQueued);
}

void TestSuccessfulUploadCatalogsAndDeletesLocalFile() {
  auto       p    = MakePipeline();
  const auto path = WriteArtifact(TestDir("success"), "cam-front", "b-1");

  p.queue->Enqueue(Task("b-1", path));
  assert(p.workers->ProcessOnce());
  assert(!p.workers->ProcessOnce());

  const auto task = p.queue->Find("b-1");
  assert(task->status == UploadStatus::kUploaded);
  assert(task->remote_url == "mem://recordings/b-1.mp4");
  assert(!std::filesystem::exists(path));

  const auto record = p.bookings->Artifact("b-1");
  assert(record);
  assert(record->remote_url == task->remote_url);
  assert(record->size_bytes == 10);
  assert(record->started_at == "2024-05-14T14:00:00+00:00");
}

void TestKeepLocalFileWhenConfigured() {
  auto       p    = MakePipeline(8, false);
  const auto path = WriteArtifact(TestDir("keep"), "cam-front", "b-1");

  p.queue->Enqueue(Task("b-1", path));
  assert(p.workers->ProcessOnce());
  assert(std::filesystem::exists(path));
}

void TestTransientFailuresBackOffThenSucceed() {
  auto       p    = MakePipeline();
  const auto path = WriteArtifact(TestDir("transient"), "cam-front", "b-1");
  p.store->FailNext(1);

  p.queue->Enqueue(Task("b-1", path));
  assert(p.workers->ProcessOnce());

  auto task = p.queue->Find("b-1");
  assert(task->status == UploadStatus::kPending);
  assert(task->attempt_count == 1);
  assert(task->not_before == bookrec::test::ReferenceInstant() + 1s);

  // not due yet
  assert(!p.workers->ProcessOnce());
  p.clock->Advance(1s);
  assert(p.workers->ProcessOnce());
  assert(p.queue->Find("b-1")->status == UploadStatus::kUploaded);
}

void TestRetriesExhaustToPermanentFailure() {
  auto       p    = MakePipeline();
  const auto path = WriteArtifact(TestDir("exhausted"), "cam-front", "b-1");
  p.store->FailNext(10);

  p.queue->Enqueue(Task("b-1", path));
  for (int i = 0; i < 3; ++i) {
    assert(p.workers->ProcessOnce());
    p.clock->Advance(10s);
  }

  const auto task = p.queue->Find("b-1");
  assert(task->status == UploadStatus::kPermanentlyFailed);
  assert(task->attempt_count == 3);
  // local file kept for manual recovery
  assert(std::filesystem::exists(path));

  const auto counts = p.queue->CountsFor("cam-front");
  assert(counts.pending == 0);
  assert(counts.failed == 1);
  assert(counts.failed_bookings.front() == "b-1");
  assert(!p.queue->HasActive());

  // operator re-queues after fixing the bucket
  assert(p.queue->Enqueue(Task("b-1", path)) == EnqueueOutcome::kQueued);
  assert(p.queue->Find("b-1")->attempt_count == 0);
}

void TestUploadedTasksArePrunedAfterRetention() {
  auto       p   = MakePipeline(4);
  const auto dir = TestDir("prune");

  for (int i = 0; i < 200; ++i) {
    const auto id = "b-" + std::to_string(i);
    assert(p.queue->Enqueue(Task(id, WriteArtifact(dir, "cam-front", id))) == EnqueueOutcome::kQueued);
    assert(p.workers->ProcessOnce());
  }

  const auto failed_path = WriteArtifact(dir, "cam-front", "b-failed");
  p.store->FailPermanently(true);
  p.queue->Enqueue(Task("b-failed", failed_path));
  assert(p.workers->ProcessOnce());
  p.store->FailPermanently(false);

  // still inside the retention window: a replayed hand-off is a duplicate
  p.clock->Advance(59min);
  assert(!p.workers->ProcessOnce());
  assert(p.queue->Find("b-0"));
  assert(p.queue->Enqueue(Task("b-0", dir / "b-0.mp4")) == EnqueueOutcome::kDuplicate);

  p.clock->Advance(1min);
  assert(!p.workers->ProcessOnce());
  for (int i = 0; i < 200; ++i) {
    assert(!p.queue->Find("b-" + std::to_string(i)));
  }
  assert(p.store->object_count() == 200);

  // failed work stays visible until someone acts on it
  const auto failed = p.queue->Find("b-failed");
  assert(failed && failed->status == UploadStatus::kPermanentlyFailed);
  assert(p.queue->CountsFor("cam-front").failed == 1);
  assert(std::filesystem::exists(failed_path));
}

void TestPermanentFailureIsNotRetried() {
  auto       p    = MakePipeline();
  const auto path = WriteArtifact(TestDir("permanent"), "cam-front", "b-1");
  p.store->FailPermanently(true);

  p.queue->Enqueue(Task("b-1", path));
  assert(p.workers->ProcessOnce());
  assert(p.queue->Find("b-1")->status == UploadStatus::kPermanentlyFailed);
  assert(p.store->calls() == 1);
}

void TestCatalogWriteIsRetried() {
  auto       p    = MakePipeline();
  const auto path = WriteArtifact(TestDir("catalog"), "cam-front", "b-1");
  p.bookings->SetWritable(false);

  p.queue->Enqueue(Task("b-1", path));
  assert(p.workers->ProcessOnce());
  assert(p.queue->Find("b-1")->status == UploadStatus::kUploaded);
  assert(p.bookings->ArtifactCount() == 0);

  p.bookings->SetWritable(true);
  assert(!p.workers->ProcessOnce());
  assert(p.bookings->ArtifactCount() == 1);
}

void TestWorkerThreadsDrainQueue() {
  auto       p   = MakePipeline();
  const auto dir = TestDir("threads");
  for (int i = 0; i < 4; ++i) {
    const auto id = "b-" + std::to_string(i);
    p.queue->Enqueue(Task(id, WriteArtifact(dir, "cam-front", id)));
  }

  p.workers->Start();
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (p.queue->HasActive() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  p.workers->Stop();

  assert(!p.queue->HasActive());
  assert(p.store->object_count() == 4);
}

void TestOrphanRecoveryQueuesUntrackedArtifacts() {
  auto       p   = MakePipeline();
  const auto dir = TestDir("orphans");

  WriteArtifact(dir, "cam-front", "b-orphan");
  WriteArtifact(dir, "cam-front", "b-known");
  WriteArtifact(dir, "cam-unmanaged", "b-foreign");
  {
    std::ofstream junk(dir / "cam-front" / "thumbnail.jpg");
    junk << "x";
  }

  p.queue->Enqueue(Task("b-known", dir / "cam-front" / "whatever.mp4"));

  const auto recovered = bookrec::upload::RecoverOrphans(dir, {"cam-front", "cam-side"}, "studio-a", *p.queue);
  assert(recovered == 1);

  const auto task = p.queue->Find("b-orphan");
  assert(task);
  assert(task->camera_id == "cam-front");
  assert(task->user_id == "studio-a");
  assert(!p.queue->Find("b-foreign"));
}

} // namespace

int main() {
  TestEnqueueIsIdempotentPerBooking();
  TestCapacityCountsOnlyActiveTasks();
  TestSuccessfulUploadCatalogsAndDeletesLocalFile();
  TestKeepLocalFileWhenConfigured();
  TestTransientFailuresBackOffThenSucceed();
  TestRetriesExhaustToPermanentFailure();
  TestPermanentFailureIsNotRetried();
  TestUploadedTasksArePrunedAfterRetention();
  TestCatalogWriteIsRetried();
  TestWorkerThreadsDrainQueue();
  TestOrphanRecoveryQueuesUntrackedArtifacts();

  std::cout << "booking_recorder_unit_upload_pipeline: pass\n";
  return 0;
}
