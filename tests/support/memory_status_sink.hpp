#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/status/status_sink.hpp"

namespace bookrec::test {

// Keeps the latest snapshot per camera.
class MemoryStatusSink final : public status::StatusSink {
 public:
  db::Result Write(const std::string& camera_id, const bookrec::v1::CameraStatus& status) override {
    std::lock_guard lock(mutex_);
    ++writes_;
    if (!available_) {
      return db::Result::Err(db::ErrorCode::Unavailable, "status table unreachable");
    }
    latest_[camera_id] = status;
    return db::Result::Ok();
  }

  void SetAvailable(bool available) {
    std::lock_guard lock(mutex_);
    available_ = available;
  }

  bool Has(const std::string& camera_id) const {
    std::lock_guard lock(mutex_);
    return latest_.count(camera_id) > 0;
  }

  bookrec::v1::CameraStatus Latest(const std::string& camera_id) const {
    std::lock_guard lock(mutex_);
    return latest_.at(camera_id);
  }

  int writes() const {
    std::lock_guard lock(mutex_);
    return writes_;
  }

 private:
  mutable std::mutex                               mutex_;
  std::map<std::string, bookrec::v1::CameraStatus> latest_;
  bool                                             available_ = true;
  int                                              writes_    = 0;
};

} // namespace bookrec::test
