#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bookrec::camera {

/*
  Structured driver failure reasons.

  Drivers never throw across this interface; every call reports one of
  these so the lifecycle can log and count it.
*/
enum class DriverCode {
  kOk = 0,

  kDeviceUnavailable,
  kConfigurationRejected,
  kCaptureFailed,
  kIoError,
  kTimeout,
  kBusy,
  kNotOpen,
  kInternal,
};

constexpr std::string_view ToString(DriverCode code) {
  switch (code) {
    case DriverCode::kOk:
      return "ok";
    case DriverCode::kDeviceUnavailable:
      return "device_unavailable";
    case DriverCode::kConfigurationRejected:
      return "configuration_rejected";
    case DriverCode::kCaptureFailed:
      return "capture_failed";
    case DriverCode::kIoError:
      return "io_error";
    case DriverCode::kTimeout:
      return "timeout";
    case DriverCode::kBusy:
      return "busy";
    case DriverCode::kNotOpen:
      return "not_open";
    case DriverCode::kInternal:
      return "internal";
  }
  return "unknown";
}

struct DriverResult {
  DriverCode  code = DriverCode::kOk;
  std::string message;

  static DriverResult Ok() {
    return {};
  }

  static DriverResult Err(DriverCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == DriverCode::kOk;
  }

  std::string Describe() const {
    return message.empty() ? std::string(ToString(code)) : std::string(ToString(code)) + ": " + message;
  }
};

struct CaptureFormat {
  std::uint32_t width  = 1920;
  std::uint32_t height = 1080;
  std::uint32_t fps    = 30;
  std::string   fourcc = "mp4v";
};

/*
  Adapter over one physical camera.

  Call order for a session:
      Open -> Configure -> Start(artifact) -> CaptureTestFrame -> ... -> Stop -> Close

  Implementations are driven from a single thread (the camera's lifecycle)
  and need no internal locking for that.
*/
class CameraDriver {
 public:
  virtual ~CameraDriver() = default;

  virtual DriverResult Open() = 0;
  virtual DriverResult Configure(const CaptureFormat& format) = 0;

  // begin writing the recording to artifact_path
  virtual DriverResult Start(const std::filesystem::path& artifact_path) = 0;

  // grab one frame to prove capture works; frame receives the encoded bytes
  virtual DriverResult CaptureTestFrame(std::vector<std::uint8_t>& frame) = 0;

  virtual DriverResult Stop()  = 0;
  virtual DriverResult Close() = 0;
};

} // namespace bookrec::camera
