#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/camera/camera_driver.hpp"

namespace bookrec::test {

/*
  Scriptable driver. Start() writes a small file at the artifact path so
  finalize has something to hand to the uploader.
*/
class FakeCameraDriver final : public camera::CameraDriver {
 public:
  camera::DriverResult Open() override {
    ++open_calls;
    if (open_failures_left > 0) {
      --open_failures_left;
      return camera::DriverResult::Err(camera::DriverCode::kDeviceUnavailable, "no such device");
    }
    if (hang_on_open.count() > 0) {
      std::this_thread::sleep_for(hang_on_open);
    }
    if (on_open) on_open();
    open = true;
    return camera::DriverResult::Ok();
  }

  camera::DriverResult Configure(const camera::CaptureFormat& format) override {
    configured_fps = format.fps;
    return camera::DriverResult::Ok();
  }

  camera::DriverResult Start(const std::filesystem::path& artifact_path) override {
    ++start_calls;
    if (fail_start) {
      return camera::DriverResult::Err(camera::DriverCode::kIoError, "encoder rejected file");
    }
    {
      std::lock_guard lock(mutex_);
      last_artifact_ = artifact_path;
    }
    if (write_artifact) {
      std::filesystem::create_directories(artifact_path.parent_path());
      std::ofstream out(artifact_path, std::ios::binary);
      out << "fake-mp4-payload";
    }
    recording = true;
    return camera::DriverResult::Ok();
  }

  camera::DriverResult CaptureTestFrame(std::vector<std::uint8_t>& frame) override {
    if (fail_test_frame) {
      return camera::DriverResult::Err(camera::DriverCode::kCaptureFailed, "empty frame");
    }
    frame.assign(16, 0xff);
    return camera::DriverResult::Ok();
  }

  camera::DriverResult Stop() override {
    ++stop_calls;
    if (stop_failures_left > 0) {
      --stop_failures_left;
      return camera::DriverResult::Err(camera::DriverCode::kTimeout, "encoder did not flush");
    }
    recording = false;
    return camera::DriverResult::Ok();
  }

  camera::DriverResult Close() override {
    ++close_calls;
    open = false;
    return camera::DriverResult::Ok();
  }

  std::filesystem::path last_artifact() const {
    std::lock_guard lock(mutex_);
    return last_artifact_;
  }

  std::atomic<int>          open_failures_left{0};
  std::atomic<bool>         fail_start{false};
  std::atomic<bool>         fail_test_frame{false};
  std::atomic<bool>         write_artifact{true};
  std::atomic<int>          stop_failures_left{0};
  std::chrono::milliseconds hang_on_open{0};
  std::function<void()>     on_open; // runs inside Open(), e.g. to move a ManualClock

  std::atomic<int>           open_calls{0};
  std::atomic<int>           start_calls{0};
  std::atomic<int>           stop_calls{0};
  std::atomic<int>           close_calls{0};
  std::atomic<bool>          open{false};
  std::atomic<bool>          recording{false};
  std::atomic<std::uint32_t> configured_fps{0};

 private:
  mutable std::mutex    mutex_;
  std::filesystem::path last_artifact_;
};

} // namespace bookrec::test
