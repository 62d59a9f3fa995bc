#include "opencv_camera_driver.hpp"

#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace bookrec::camera {

namespace {

constexpr std::chrono::milliseconds kTestFrameWait(3000);
constexpr std::chrono::milliseconds kReadFailureBackoff(5);

int ToOpenCvFourcc(std::string_view code) {
  if (code.size() != 4) {
    return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
  }
  return cv::VideoWriter::fourcc(code[0], code[1], code[2], code[3]);
}

bool IsDeviceIndex(const std::string& device) {
  if (device.empty()) return false;
  for (char c : device) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

} // namespace

OpenCvCameraDriver::OpenCvCameraDriver(std::string device) : device_(std::move(device)) {
}

OpenCvCameraDriver::~OpenCvCameraDriver() {
  Stop();
  Close();
}

DriverResult OpenCvCameraDriver::Open() {
  std::lock_guard lock(mutex_);
  if (capture_.isOpened()) {
    return DriverResult::Ok();
  }

  try {
    const bool opened = IsDeviceIndex(device_) ? capture_.open(std::stoi(device_), cv::CAP_ANY) : capture_.open(device_, cv::CAP_ANY);
    if (!opened || !capture_.isOpened()) {
      return DriverResult::Err(DriverCode::kDeviceUnavailable, "cannot open camera device '" + device_ + "'");
    }
  } catch (const std::exception& e) {
    return DriverResult::Err(DriverCode::kDeviceUnavailable, e.what());
  }
  return DriverResult::Ok();
}

DriverResult OpenCvCameraDriver::Configure(const CaptureFormat& format) {
  std::lock_guard lock(mutex_);
  if (!capture_.isOpened()) {
    return DriverResult::Err(DriverCode::kNotOpen, "configure before open");
  }

  format_ = format;
  capture_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(format.width));
  capture_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(format.height));
  capture_.set(cv::CAP_PROP_FPS, static_cast<double>(format.fps));

  const auto actual_width  = static_cast<std::uint32_t>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
  const auto actual_height = static_cast<std::uint32_t>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
  if (actual_width == 0 || actual_height == 0) {
    return DriverResult::Err(DriverCode::kConfigurationRejected, "device reports no frame size");
  }
  if (actual_width != format.width || actual_height != format.height) {
    BOOKREC_LOG_WARN("Camera negotiated a different resolution",
                     {observability::StringField("device", device_), observability::IntField("requested_width", format.width),
                      observability::IntField("requested_height", format.height), observability::IntField("width", actual_width),
                      observability::IntField("height", actual_height)});
  }
  return DriverResult::Ok();
}

DriverResult OpenCvCameraDriver::Start(const std::filesystem::path& artifact_path) {
  {
    std::lock_guard lock(mutex_);
    if (!capture_.isOpened()) {
      return DriverResult::Err(DriverCode::kNotOpen, "start before open");
    }
    if (pumping_) {
      return DriverResult::Err(DriverCode::kBusy, "already recording");
    }

    std::error_code ec;
    std::filesystem::create_directories(artifact_path.parent_path(), ec);
    if (ec) {
      return DriverResult::Err(DriverCode::kIoError, "cannot create " + artifact_path.parent_path().string() + ": " + ec.message());
    }

    const cv::Size frame_size(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)), static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)));
    const double   fps = format_.fps > 0 ? static_cast<double>(format_.fps) : 30.0;
    try {
      if (!writer_.open(artifact_path.string(), ToOpenCvFourcc(format_.fourcc), fps, frame_size)) {
        return DriverResult::Err(DriverCode::kIoError, "cannot open video writer for " + artifact_path.string());
      }
    } catch (const cv::Exception& e) {
      return DriverResult::Err(DriverCode::kIoError, e.what());
    }

    frames_written_ = 0;
    read_failures_  = 0;
    last_frame_.release();
  }

  pumping_ = true;
  pump_    = std::thread(&OpenCvCameraDriver::PumpFrames, this);
  return DriverResult::Ok();
}

void OpenCvCameraDriver::PumpFrames() {
  cv::Mat frame;
  while (pumping_) {
    std::unique_lock lock(mutex_);
    if (!capture_.read(frame) || frame.empty()) {
      ++read_failures_;
      lock.unlock();
      std::this_thread::sleep_for(kReadFailureBackoff);
      continue;
    }

    writer_.write(frame);
    frame.copyTo(last_frame_);
    ++frames_written_;
  }
}

DriverResult OpenCvCameraDriver::CaptureTestFrame(std::vector<std::uint8_t>& frame) {
  const auto deadline = std::chrono::steady_clock::now() + kTestFrameWait;

  for (;;) {
    {
      std::lock_guard lock(mutex_);
      if (!capture_.isOpened()) {
        return DriverResult::Err(DriverCode::kNotOpen, "capture before open");
      }

      cv::Mat sample;
      if (pumping_) {
        if (frames_written_ > 0) {
          sample = last_frame_.clone();
        }
      } else if (!capture_.read(sample)) {
        sample.release();
      }

      if (!sample.empty()) {
        try {
          if (!cv::imencode(".jpg", sample, frame) || frame.empty()) {
            return DriverResult::Err(DriverCode::kCaptureFailed, "test frame could not be encoded");
          }
        } catch (const cv::Exception& e) {
          return DriverResult::Err(DriverCode::kCaptureFailed, e.what());
        }
        return DriverResult::Ok();
      }
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      return DriverResult::Err(DriverCode::kCaptureFailed, "no frame delivered within " + std::to_string(kTestFrameWait.count()) + "ms");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

DriverResult OpenCvCameraDriver::Stop() {
  pumping_ = false;
  if (pump_.joinable()) {
    pump_.join();
  }

  std::lock_guard lock(mutex_);
  if (writer_.isOpened()) {
    writer_.release();
    BOOKREC_LOG_INFO("Camera capture stopped", {observability::StringField("device", device_),
                                                observability::IntField("frames", static_cast<std::int64_t>(frames_written_)),
                                                observability::IntField("read_failures", static_cast<std::int64_t>(read_failures_))});
  }
  return DriverResult::Ok();
}

DriverResult OpenCvCameraDriver::Close() {
  std::lock_guard lock(mutex_);
  if (capture_.isOpened()) {
    capture_.release();
  }
  last_frame_.release();
  return DriverResult::Ok();
}

} // namespace bookrec::camera
