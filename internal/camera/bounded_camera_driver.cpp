#include "bounded_camera_driver.hpp"

#include <future>
#include <string>
#include <thread>

namespace bookrec::camera {

BoundedCameraDriver::BoundedCameraDriver(std::shared_ptr<CameraDriver> inner, std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout), in_flight_(std::make_shared<std::atomic<bool>>(false)) {
}

DriverResult BoundedCameraDriver::Call(std::string_view op, std::function<DriverResult()> fn) {
  if (timeout_.count() <= 0) {
    try {
      return fn();
    } catch (const std::exception& e) {
      return DriverResult::Err(DriverCode::kInternal, std::string(op) + ": " + e.what());
    }
  }

  if (in_flight_->load()) {
    return DriverResult::Err(DriverCode::kBusy, "previous driver call still running, rejected " + std::string(op));
  }

  auto promise = std::make_shared<std::promise<DriverResult>>();
  auto result  = promise->get_future();

  in_flight_->store(true);
  std::thread([promise, flag = in_flight_, op = std::string(op), fn = std::move(fn)] {
    DriverResult status;
    try {
      status = fn();
    } catch (const std::exception& e) {
      status = DriverResult::Err(DriverCode::kInternal, op + ": " + e.what());
    }
    flag->store(false);
    promise->set_value(std::move(status));
  }).detach();

  if (result.wait_for(timeout_) != std::future_status::ready) {
    return DriverResult::Err(DriverCode::kTimeout, std::string(op) + " exceeded " + std::to_string(timeout_.count()) + "ms");
  }
  return result.get();
}

DriverResult BoundedCameraDriver::Open() {
  return Call("open", [driver = inner_] { return driver->Open(); });
}

DriverResult BoundedCameraDriver::Configure(const CaptureFormat& format) {
  return Call("configure", [driver = inner_, format] { return driver->Configure(format); });
}

DriverResult BoundedCameraDriver::Start(const std::filesystem::path& artifact_path) {
  return Call("start", [driver = inner_, artifact_path] { return driver->Start(artifact_path); });
}

DriverResult BoundedCameraDriver::CaptureTestFrame(std::vector<std::uint8_t>& frame) {
  // the helper thread may outlive this call, so it fills its own buffer
  auto buffer = std::make_shared<std::vector<std::uint8_t>>();
  auto status = Call("capture_test_frame", [driver = inner_, buffer] { return driver->CaptureTestFrame(*buffer); });
  if (status) {
    frame = std::move(*buffer);
  }
  return status;
}

DriverResult BoundedCameraDriver::Stop() {
  return Call("stop", [driver = inner_] { return driver->Stop(); });
}

DriverResult BoundedCameraDriver::Close() {
  return Call("close", [driver = inner_] { return driver->Close(); });
}

} // namespace bookrec::camera
