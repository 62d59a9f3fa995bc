#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "camera_driver.hpp"
#include "internal/backoff/backoff_controller.hpp"
#include "internal/booking/booking_source.hpp"
#include "internal/model/booking.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/util/time.hpp"

namespace bookrec::camera {

enum class LifecycleState {
  kIdle,
  kInitializing,
  kRecording,
  kFinalizing,
  kFailed, // transient, lasts until the next tick
};

constexpr std::string_view ToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kIdle:
      return "idle";
    case LifecycleState::kInitializing:
      return "initializing";
    case LifecycleState::kRecording:
      return "recording";
    case LifecycleState::kFinalizing:
      return "finalizing";
    case LifecycleState::kFailed:
      return "failed";
  }
  return "unknown";
}

struct CameraSettings {
  std::string               camera_id;
  std::filesystem::path     recordings_dir;
  CaptureFormat             format;
  std::chrono::milliseconds tick_interval{500};
};

struct RecordingSession {
  model::Booking        booking;
  util::TimePoint       started_at;
  std::filesystem::path artifact_path;
};

struct CameraSnapshot {
  std::string                    camera_id;
  LifecycleState                 state = LifecycleState::kIdle;
  bool                           is_recording = false;
  std::string                    active_booking_id;
  std::string                    pending_booking_id;
  std::uint32_t                  consecutive_failures = 0;
  std::optional<util::TimePoint> next_retry_at;
  std::uint64_t                  recording_errors = 0;
  std::string                    last_error;
};

enum class OfferOutcome {
  kAccepted,
  kAlreadyTracked,
  kBusy, // camera holds a non-overlapping booking; offer again later
};

/*
  State machine for one camera.

      Idle --start reached, MayAttempt--> Initializing --ok--> Recording
                                               |                  |
                                             fail          end / stop signal
                                               v                  v
                                      Failed (one tick)      Finalizing --> Idle
                                                               |    ^
                                                      release failed, next tick

  A recording is only handed to the uploader once the driver has released
  it. After kMaxReleaseAttempts failed releases the booking is marked
  failed and the file is left on disk.

  The lifecycle is the only caller of its driver. The poller talks to it
  through Offer() and RequestStop(); everything else reads Snapshot().
  Driver calls run without the state lock held, so Snapshot() never waits
  on hardware.

  Booking status writes and upload hand-offs that fail transiently are kept
  in order in an outbox and retried at the start of every tick.
*/
class CameraLifecycle {
 public:
  static constexpr std::uint32_t kMaxReleaseAttempts = 5;

  CameraLifecycle(CameraSettings settings, std::shared_ptr<CameraDriver> driver, std::shared_ptr<booking::BookingSource> bookings,
                  std::shared_ptr<upload::UploadQueue> uploads, backoff::BackoffPolicy policy, std::shared_ptr<util::ClockSource> clock);
  ~CameraLifecycle();

  CameraLifecycle(const CameraLifecycle&)            = delete;
  CameraLifecycle& operator=(const CameraLifecycle&) = delete;

  // Throws util::ResourceConflictError when the booking overlaps the active
  // or pending one.
  OfferOutcome Offer(const model::Booking& booking);

  // Returns false when the booking is not tracked by this camera.
  bool RequestStop(const std::string& booking_id, bool canceled);

  void Tick();

  void Start();
  void Stop();

  // Finalizes an active session. Call after Stop().
  void Shutdown();

  CameraSnapshot           Snapshot() const;
  std::vector<std::string> TrackedBookings() const;

  // Also true for a finished booking whose status write is still queued, so
  // the poller does not judge it by its stale status.
  bool IsTracking(const std::string& booking_id) const;

  const std::string& camera_id() const {
    return settings_.camera_id;
  }

 private:
  struct StatusWrite {
    std::string          booking_id;
    model::BookingStatus status;
    std::string          reason;
  };

  void Run();
  void Wake();
  void Initialize(const model::Booking& booking, util::TimePoint now);
  // Returns false while the driver still holds the recording.
  bool Finalize(const RecordingSession& session, bool canceled);
  bool ReleaseDriver();

  void WriteStatus(const std::string& booking_id, model::BookingStatus status, const std::string& reason);
  // Write whose unsettled_ count was already taken under mutex_.
  void QueueStatus(const std::string& booking_id, model::BookingStatus status, const std::string& reason);
  void HandOff(model::UploadTask task);
  void FlushOutbox();

  CameraSettings                          settings_;
  std::shared_ptr<CameraDriver>           driver_;
  std::shared_ptr<booking::BookingSource> bookings_;
  std::shared_ptr<upload::UploadQueue>    uploads_;
  std::shared_ptr<util::ClockSource>      clock_;

  // serializes Tick() and Shutdown(); guards the outbox
  std::mutex              tick_mutex_;
  std::deque<StatusWrite> pending_writes_;
  std::deque<model::UploadTask> pending_uploads_;

  mutable std::mutex              mutex_;
  LifecycleState                  state_ = LifecycleState::kIdle;
  std::optional<model::Booking>   pending_;
  std::optional<RecordingSession> session_;
  std::map<std::string, bool>     stop_requests_; // booking_id -> canceled
  std::map<std::string, int>      unsettled_;     // booking_id -> queued status writes
  backoff::BackoffController      backoff_;
  std::uint64_t                   recording_errors_ = 0;
  std::uint32_t                   release_failures_ = 0;
  std::string                     last_error_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  bool                    wake_requested_ = false;
};

} // namespace bookrec::camera
