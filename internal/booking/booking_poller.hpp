#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "booking_source.hpp"
#include "internal/camera/camera_lifecycle.hpp"
#include "internal/schedule/time_window_normalizer.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/util/time.hpp"

namespace bookrec::booking {

struct PollerSettings {
  std::string               user_id; // empty polls every user's bookings
  std::chrono::milliseconds poll_interval{5000};
  std::chrono::minutes      lookahead{60};
  std::chrono::hours        max_booking_age{24};
};

struct PollReport {
  bool        ok         = false;
  std::size_t candidates = 0;
  std::size_t invalid    = 0;
  std::size_t missed     = 0;
  std::size_t conflicts  = 0;
  std::size_t offered    = 0;
  std::size_t stopped    = 0;
  std::size_t recovered  = 0;
};

/*
  Feeds the camera lifecycles from the booking source.

  One cycle:
    1. fetch scheduled candidates for this node's cameras
    2. normalize; invalid rows are marked failed and logged once
    3. per camera, in (start, id) order:
         elapsed and never tracked     -> failed (missed)
         overlaps an earlier keeper    -> failed (conflict)
         starts within one poll        -> offered to the camera
    4. bookings still marked recording that no camera tracks were cut off
       by a restart: completed when their artifact reached the upload
       queue, failed otherwise
    5. tracked bookings that were canceled or removed at the source are
       stopped

  A TransientSourceError skips the rest of the cycle.
*/
class BookingPoller {
 public:
  BookingPoller(PollerSettings settings, std::shared_ptr<BookingSource> source, schedule::TimeWindowNormalizer normalizer,
                std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras, std::shared_ptr<upload::UploadQueue> uploads,
                std::shared_ptr<util::ClockSource> clock);
  ~BookingPoller();

  PollReport PollOnce();

  void Start();
  void Stop();

 private:
  void Run();
  void Schedule(camera::CameraLifecycle& camera, std::vector<model::Booking> bookings, util::TimePoint now, PollReport& report);
  void RecoverInterrupted(const CandidateQuery& query, PollReport& report);
  bool IsTracked(const std::string& booking_id) const;
  void CheckCancellations(PollReport& report);
  void MarkFailed(const std::string& booking_id, const std::string& reason);

  PollerSettings                                        settings_;
  std::shared_ptr<BookingSource>                        source_;
  schedule::TimeWindowNormalizer                        normalizer_;
  std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras_;
  std::shared_ptr<upload::UploadQueue>                  uploads_;
  std::shared_ptr<util::ClockSource>                    clock_;

  // ids already reported as invalid, so a row that cannot be marked failed is not logged every cycle
  std::set<std::string> reported_invalid_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace bookrec::booking
