#include "internal/camera/camera_lifecycle.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/booking/memory_booking_source.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_camera_driver.hpp"
#include "support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using bookrec::camera::CameraLifecycle;
using bookrec::camera::LifecycleState;
using bookrec::camera::OfferOutcome;
using bookrec::model::BookingStatus;

struct Rig {
  std::filesystem::path                                  dir;
  std::shared_ptr<bookrec::test::ManualClock>            clock;
  std::shared_ptr<bookrec::test::FakeCameraDriver>       driver;
  std::shared_ptr<bookrec::booking::MemoryBookingSource> bookings;
  std::shared_ptr<bookrec::upload::UploadQueue>          uploads;
  std::unique_ptr<CameraLifecycle>                       camera;
};

Rig MakeRig(const std::string& name, std::size_t upload_capacity = 8) {
  Rig rig;
  rig.dir = std::filesystem::temp_directory_path() / "booking_recorder_lifecycle_tests" / name;
  std::filesystem::remove_all(rig.dir);

  rig.clock    = std::make_shared<bookrec::test::ManualClock>(bookrec::test::ReferenceInstant());
  rig.driver   = std::make_shared<bookrec::test::FakeCameraDriver>();
  rig.bookings = std::make_shared<bookrec::booking::MemoryBookingSource>();
  rig.uploads  = std::make_shared<bookrec::upload::UploadQueue>(upload_capacity, rig.clock);

  bookrec::camera::CameraSettings settings;
  settings.camera_id      = "cam-front";
  settings.recordings_dir = rig.dir;
  settings.tick_interval  = 20ms;

  rig.camera = std::make_unique<CameraLifecycle>(settings, rig.driver, rig.bookings, rig.uploads, bookrec::backoff::BackoffPolicy{}, rig.clock);
  return rig;
}

// Registers the booking at the source and returns its normalized form.
bookrec::model::Booking AddBooking(Rig& rig, const std::string& id, std::chrono::seconds start_offset, std::chrono::seconds length) {
  bookrec::model::RawBooking raw;
  raw.id        = id;
  raw.camera_id = "cam-front";
  raw.user_id   = "studio-a";
  raw.status    = "scheduled";
  rig.bookings->Put(raw);

  bookrec::model::Booking booking;
  booking.id        = id;
  booking.camera_id = "cam-front";
  booking.user_id   = "studio-a";
  booking.start     = bookrec::test::ReferenceInstant() + start_offset;
  booking.end       = booking.start + length;
  return booking;
}

std::string SourceStatus(const Rig& rig, const std::string& id) {
  return rig.bookings->Get(id)->status;
}

void TestRecordsForTheBookedWindow() {
  auto rig     = MakeRig("window");
  auto booking = AddBooking(rig, "b-1", 60s, 300s);

  assert(rig.camera->Offer(booking) == OfferOutcome::kAccepted);
  rig.camera->Tick();
  assert(rig.driver->open_calls == 0 && "must not start early");
  assert(rig.camera->Snapshot().pending_booking_id == "b-1");

  rig.clock->Advance(60s);
  rig.camera->Tick();

  auto snapshot = rig.camera->Snapshot();
  assert(snapshot.state == LifecycleState::kRecording);
  assert(snapshot.is_recording);
  assert(snapshot.active_booking_id == "b-1");
  assert(snapshot.pending_booking_id.empty());
  assert(SourceStatus(rig, "b-1") == "recording");
  assert(std::filesystem::exists(rig.driver->last_artifact()));

  rig.clock->Advance(299s);
  rig.camera->Tick();
  assert(rig.camera->Snapshot().is_recording);

  rig.clock->Advance(1s);
  rig.camera->Tick();

  snapshot = rig.camera->Snapshot();
  assert(snapshot.state == LifecycleState::kIdle);
  assert(!snapshot.is_recording);
  assert(rig.driver->stop_calls == 1 && rig.driver->close_calls == 1);
  assert(SourceStatus(rig, "b-1") == "completed");

  const auto task = rig.uploads->Find("b-1");
  assert(task);
  assert(task->artifact_path == rig.driver->last_artifact().string());
  assert(task->user_id == "studio-a");
}

void TestInitFailureBacksOff() {
  auto rig                        = MakeRig("backoff");
  rig.driver->open_failures_left  = 2;
  auto booking                    = AddBooking(rig, "b-1", 0s, 600s);
  rig.camera->Offer(booking);

  rig.camera->Tick();
  auto snapshot = rig.camera->Snapshot();
  assert(snapshot.state == LifecycleState::kFailed);
  assert(snapshot.consecutive_failures == 1);
  assert(snapshot.recording_errors == 1);
  assert(*snapshot.next_retry_at == bookrec::test::ReferenceInstant() + 2s);
  assert(snapshot.last_error.find("device_unavailable") != std::string::npos);
  assert(rig.driver->close_calls == 1 && "partial init must release the device");
  assert(SourceStatus(rig, "b-1") == "scheduled");

  rig.clock->Advance(1s);
  rig.camera->Tick();
  assert(rig.driver->open_calls == 1 && "retry before the backoff delay");
  assert(rig.camera->Snapshot().state == LifecycleState::kIdle);

  rig.clock->Advance(1s);
  rig.camera->Tick();
  assert(rig.driver->open_calls == 2);
  assert(*rig.camera->Snapshot().next_retry_at == bookrec::test::ReferenceInstant() + 6s);

  rig.clock->Advance(4s);
  rig.camera->Tick();
  snapshot = rig.camera->Snapshot();
  assert(snapshot.is_recording);
  assert(snapshot.consecutive_failures == 0);
  assert(!snapshot.next_retry_at);
  assert(snapshot.recording_errors == 2);
}

void TestTestFrameFailureRemovesPartialFile() {
  auto rig                    = MakeRig("test_frame");
  rig.driver->fail_test_frame = true;
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 600s));

  rig.camera->Tick();
  assert(!rig.camera->Snapshot().is_recording);
  assert(!rig.driver->last_artifact().empty());
  assert(!std::filesystem::exists(rig.driver->last_artifact()));
}

void TestWindowElapsesWhileFailing() {
  auto rig                       = MakeRig("elapsed");
  rig.driver->open_failures_left = 100;
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 5s));

  rig.camera->Tick();
  rig.clock->Advance(2s);
  rig.camera->Tick();
  rig.clock->Advance(4s);
  rig.camera->Tick();

  const auto snapshot = rig.camera->Snapshot();
  assert(snapshot.pending_booking_id.empty());
  assert(!snapshot.is_recording);
  assert(SourceStatus(rig, "b-1") == "failed");
  assert(rig.bookings->Reason("b-1").find("window elapsed") != std::string::npos);
  assert(!rig.uploads->Find("b-1"));
}

void TestOverlapIsRejectedAndLaterBookingWaits() {
  auto rig = MakeRig("overlap");
  auto b1  = AddBooking(rig, "b-1", 0s, 600s);
  auto b2  = AddBooking(rig, "b-2", 300s, 600s);
  auto b3  = AddBooking(rig, "b-3", 600s, 600s);

  assert(rig.camera->Offer(b1) == OfferOutcome::kAccepted);
  assert(rig.camera->Offer(b1) == OfferOutcome::kAlreadyTracked);

  bool threw = false;
  try {
    rig.camera->Offer(b2);
  } catch (const bookrec::util::ResourceConflictError&) {
    threw = true;
  }
  assert(threw);

  // back-to-back is not an overlap
  assert(rig.camera->Offer(b3) == OfferOutcome::kBusy);

  rig.camera->Tick();
  assert(rig.camera->Snapshot().active_booking_id == "b-1");

  threw = false;
  try {
    rig.camera->Offer(b2);
  } catch (const bookrec::util::ResourceConflictError&) {
    threw = true;
  }
  assert(threw && "overlap with the active session");

  rig.clock->Advance(600s);
  rig.camera->Tick();
  assert(rig.camera->Offer(b3) == OfferOutcome::kAccepted);
  rig.camera->Tick();
  assert(rig.camera->Snapshot().active_booking_id == "b-3");
}

void TestCancelDuringRecordingStopsAndUploadsWithoutStatusWrite() {
  auto rig = MakeRig("cancel_active");
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 600s));
  rig.camera->Tick();
  assert(rig.camera->Snapshot().is_recording);

  rig.clock->Advance(60s);
  rig.bookings->ForceStatus("b-1", "canceled");
  assert(rig.camera->RequestStop("b-1", true));
  rig.camera->Tick();

  assert(!rig.camera->Snapshot().is_recording);
  assert(rig.driver->stop_calls == 1);
  assert(SourceStatus(rig, "b-1") == "canceled");
  assert(rig.uploads->Find("b-1"));
}

void TestCancelBeforeStartWithdraws() {
  auto rig = MakeRig("cancel_pending");
  rig.camera->Offer(AddBooking(rig, "b-1", 60s, 600s));

  assert(!rig.camera->RequestStop("b-unknown", true));
  assert(rig.camera->RequestStop("b-1", true));
  rig.camera->Tick();

  assert(!rig.camera->IsTracking("b-1"));
  rig.clock->Advance(120s);
  rig.camera->Tick();
  assert(rig.driver->open_calls == 0);
}

void TestStatusWritesSurviveSourceOutage() {
  auto rig = MakeRig("outbox");
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 10s));
  rig.bookings->SetWritable(false);

  rig.camera->Tick();
  assert(rig.camera->Snapshot().is_recording);
  assert(SourceStatus(rig, "b-1") == "scheduled");

  rig.clock->Advance(10s);
  rig.camera->Tick();
  assert(SourceStatus(rig, "b-1") == "scheduled");

  rig.bookings->SetWritable(true);
  rig.camera->Tick();
  // recording then completed, in order
  assert(SourceStatus(rig, "b-1") == "completed");
}

void TestMissingArtifactFailsBooking() {
  auto rig                   = MakeRig("no_artifact");
  rig.driver->write_artifact = false;
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 10s));

  rig.camera->Tick();
  rig.clock->Advance(10s);
  rig.camera->Tick();

  assert(SourceStatus(rig, "b-1") == "failed");
  assert(rig.camera->Snapshot().recording_errors == 1);
  assert(!rig.uploads->Find("b-1"));
}

void TestFullUploadQueueDefersHandOff() {
  auto rig = MakeRig("queue_full", 1);

  bookrec::model::UploadTask blocker;
  blocker.booking_id    = "b-old";
  blocker.camera_id     = "cam-front";
  blocker.artifact_path = "/nonexistent";
  assert(rig.uploads->Enqueue(blocker) == bookrec::upload::EnqueueOutcome::kQueued);

  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 10s));
  rig.camera->Tick();
  rig.clock->Advance(10s);
  rig.camera->Tick();
  assert(!rig.uploads->Find("b-1"));
  assert(SourceStatus(rig, "b-1") == "completed");

  auto taken = rig.uploads->TryDequeue();
  assert(taken && taken->booking_id == "b-old");
  rig.uploads->MarkUploaded("b-old", "mem://b-old");

  rig.camera->Tick();
  assert(rig.uploads->Find("b-1"));
}

void TestWindowElapsingDuringSlowOpenFailsBooking() {
  auto rig            = MakeRig("slow_open");
  rig.driver->on_open = [clock = rig.clock] { clock->Advance(90s); };
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 60s));

  rig.camera->Tick();

  auto snapshot = rig.camera->Snapshot();
  assert(!snapshot.is_recording);
  assert(snapshot.pending_booking_id.empty());
  assert(snapshot.recording_errors == 1);
  assert(snapshot.last_error == "window elapsed during initialization");
  assert(SourceStatus(rig, "b-1") == "failed");
  assert(rig.driver->stop_calls == 1 && rig.driver->close_calls == 1);
  assert(!rig.driver->open);
  assert(!std::filesystem::exists(rig.driver->last_artifact()));
  assert(!rig.uploads->Find("b-1"));

  rig.camera->Tick();
  assert(rig.camera->Snapshot().state == LifecycleState::kIdle);
  assert(rig.driver->open_calls == 1);
}

void TestReleaseFailureDelaysHandOff() {
  auto rig                       = MakeRig("release_retry");
  rig.driver->stop_failures_left = 1;
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 10s));
  rig.camera->Tick();

  rig.clock->Advance(10s);
  rig.camera->Tick();
  auto snapshot = rig.camera->Snapshot();
  assert(snapshot.state == LifecycleState::kFinalizing);
  assert(snapshot.is_recording);
  assert(!rig.uploads->Find("b-1"));
  assert(SourceStatus(rig, "b-1") == "recording");
  assert(rig.camera->IsTracking("b-1"));

  rig.camera->Tick();
  snapshot = rig.camera->Snapshot();
  assert(snapshot.state == LifecycleState::kIdle);
  assert(!snapshot.is_recording);
  assert(rig.driver->stop_calls == 2);
  assert(rig.uploads->Find("b-1"));
  assert(SourceStatus(rig, "b-1") == "completed");
}

void TestCameraThatNeverReleasesFailsBookingAndKeepsFile() {
  auto rig                       = MakeRig("release_gives_up");
  rig.driver->stop_failures_left = 100;
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 10s));
  rig.camera->Tick();
  const auto artifact = rig.driver->last_artifact();

  rig.clock->Advance(10s);
  for (std::uint32_t i = 1; i < CameraLifecycle::kMaxReleaseAttempts; ++i) {
    rig.camera->Tick();
    assert(rig.camera->Snapshot().state == LifecycleState::kFinalizing);
  }
  rig.camera->Tick();

  const auto snapshot = rig.camera->Snapshot();
  assert(!snapshot.is_recording);
  assert(snapshot.state == LifecycleState::kFailed);
  assert(snapshot.recording_errors == 1);
  assert(rig.driver->stop_calls == static_cast<int>(CameraLifecycle::kMaxReleaseAttempts));
  assert(SourceStatus(rig, "b-1") == "failed");
  assert(std::filesystem::exists(artifact));
  assert(!rig.uploads->Find("b-1"));
}

void TestShutdownFinalizesActiveSession() {
  auto rig = MakeRig("shutdown");
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 3600s));
  rig.camera->Tick();
  assert(rig.camera->Snapshot().is_recording);

  rig.camera->Shutdown();
  assert(!rig.camera->Snapshot().is_recording);
  assert(SourceStatus(rig, "b-1") == "completed");
  assert(rig.uploads->Find("b-1"));
}

void TestBackgroundThreadReactsToOffer() {
  auto rig = MakeRig("thread");
  rig.camera->Start();
  rig.camera->Offer(AddBooking(rig, "b-1", 0s, 3600s));

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!rig.camera->Snapshot().is_recording && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  rig.camera->Stop();
  assert(rig.camera->Snapshot().is_recording);

  rig.camera->Shutdown();
  assert(SourceStatus(rig, "b-1") == "completed");
}

} // namespace

int main() {
  TestRecordsForTheBookedWindow();
  TestInitFailureBacksOff();
  TestTestFrameFailureRemovesPartialFile();
  TestWindowElapsesWhileFailing();
  TestOverlapIsRejectedAndLaterBookingWaits();
  TestCancelDuringRecordingStopsAndUploadsWithoutStatusWrite();
  TestCancelBeforeStartWithdraws();
  TestStatusWritesSurviveSourceOutage();
  TestMissingArtifactFailsBooking();
  TestFullUploadQueueDefersHandOff();
  TestWindowElapsingDuringSlowOpenFailsBooking();
  TestReleaseFailureDelaysHandOff();
  TestCameraThatNeverReleasesFailsBookingAndKeepsFile();
  TestShutdownFinalizesActiveSession();
  TestBackgroundThreadReactsToOffer();

  std::cout << "booking_recorder_unit_camera_lifecycle: pass\n";
  return 0;
}
