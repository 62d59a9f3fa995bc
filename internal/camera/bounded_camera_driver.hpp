#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

#include "camera_driver.hpp"

namespace bookrec::camera {

/*
  Decorator that bounds every driver call by a timeout.

  Each call runs on a detached helper thread; if it does not finish in
  time the caller gets DriverCode::kTimeout and the lifecycle treats it like
  any other failure. The hung call keeps the inner driver alive through the
  shared_ptr, and further calls report kBusy until it returns.

  A zero timeout runs calls inline.
*/
class BoundedCameraDriver final : public CameraDriver {
 public:
  BoundedCameraDriver(std::shared_ptr<CameraDriver> inner, std::chrono::milliseconds timeout);

  DriverResult Open() override;
  DriverResult Configure(const CaptureFormat& format) override;
  DriverResult Start(const std::filesystem::path& artifact_path) override;
  DriverResult CaptureTestFrame(std::vector<std::uint8_t>& frame) override;
  DriverResult Stop() override;
  DriverResult Close() override;

 private:
  DriverResult Call(std::string_view op, std::function<DriverResult()> fn);

  std::shared_ptr<CameraDriver>      inner_;
  std::chrono::milliseconds          timeout_;
  std::shared_ptr<std::atomic<bool>> in_flight_;
};

} // namespace bookrec::camera
