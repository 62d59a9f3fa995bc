#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bookrec/v1.hpp"
#include "internal/camera/camera_lifecycle.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/util/time.hpp"
#include "status_sink.hpp"

namespace bookrec::status {

struct ReporterSettings {
  std::string               node_id;
  std::string               user_id;
  std::filesystem::path     recordings_dir;
  std::chrono::milliseconds heartbeat_interval{3000};
};

/*
  Publishes a health snapshot for every camera on its own cadence.

  Snapshots are assembled from CameraLifecycle::Snapshot(), the upload
  queue counters and the size of the camera's recordings directory. A
  failed sink write is logged and simply retried on the next heartbeat.
*/
class StatusReporter {
 public:
  StatusReporter(ReporterSettings settings, std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras,
                 std::shared_ptr<upload::UploadQueue> uploads, std::shared_ptr<StatusSink> sink, std::shared_ptr<util::ClockSource> clock);
  ~StatusReporter();

  bookrec::v1::NodeStatus Collect() const;

  // nullopt when the camera is not managed by this node
  std::optional<bookrec::v1::CameraStatus> CollectCamera(const std::string& camera_id) const;

  // true when every camera's snapshot was written
  bool ReportOnce();

  void Start();
  void Stop();

 private:
  bookrec::v1::CameraStatus Build(const camera::CameraLifecycle& camera, util::TimePoint now) const;
  void                      Run();

  ReporterSettings                                      settings_;
  std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras_;
  std::shared_ptr<upload::UploadQueue>                  uploads_;
  std::shared_ptr<StatusSink>                           sink_;
  std::shared_ptr<util::ClockSource>                    clock_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

// Total size of regular files below dir; 0 when it does not exist.
std::uint64_t DirectorySize(const std::filesystem::path& dir);

bookrec::v1::CameraState ToProto(camera::LifecycleState state);

} // namespace bookrec::status
