#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <opencv2/core/mat.hpp>
#include <opencv2/videoio.hpp>

#include "camera_driver.hpp"

namespace bookrec::camera {

/*
  CameraDriver over OpenCV VideoCapture / VideoWriter.

  device is either a numeric V4L2 index ("0") or anything VideoCapture can
  open (a /dev path, an RTSP URL, a GStreamer pipeline).

  Start() spawns a frame pump that copies captured frames into the
  artifact until Stop(). Encoding is entirely OpenCV's.
*/
class OpenCvCameraDriver final : public CameraDriver {
 public:
  explicit OpenCvCameraDriver(std::string device);
  ~OpenCvCameraDriver() override;

  OpenCvCameraDriver(const OpenCvCameraDriver&)            = delete;
  OpenCvCameraDriver& operator=(const OpenCvCameraDriver&) = delete;

  DriverResult Open() override;
  DriverResult Configure(const CaptureFormat& format) override;
  DriverResult Start(const std::filesystem::path& artifact_path) override;
  DriverResult CaptureTestFrame(std::vector<std::uint8_t>& frame) override;
  DriverResult Stop() override;
  DriverResult Close() override;

 private:
  void PumpFrames();

  std::string   device_;
  CaptureFormat format_;

  std::mutex       mutex_;
  cv::VideoCapture capture_;
  cv::VideoWriter  writer_;
  cv::Mat          last_frame_;
  std::uint64_t    frames_written_ = 0;
  std::uint64_t    read_failures_  = 0;

  std::thread       pump_;
  std::atomic<bool> pumping_{false};
};

} // namespace bookrec::camera
