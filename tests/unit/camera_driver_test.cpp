#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/camera/artifact_naming.hpp"
#include "internal/camera/bounded_camera_driver.hpp"
#include "support/fake_camera_driver.hpp"
#include "support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using bookrec::camera::BoundedCameraDriver;
using bookrec::camera::DriverCode;

void TestCallsPassThroughWithinTimeout() {
  auto fake = std::make_shared<bookrec::test::FakeCameraDriver>();
  BoundedCameraDriver driver(fake, 1000ms);

  assert(driver.Open());
  assert(fake->open);

  bookrec::camera::CaptureFormat format;
  format.fps = 25;
  assert(driver.Configure(format));
  assert(fake->configured_fps == 25);

  std::vector<std::uint8_t> frame;
  assert(driver.CaptureTestFrame(frame));
  assert(frame.size() == 16);

  assert(driver.Close());
  assert(!fake->open);
}

void TestFailureCodesAreKept() {
  auto fake                = std::make_shared<bookrec::test::FakeCameraDriver>();
  fake->open_failures_left = 1;
  BoundedCameraDriver driver(fake, 1000ms);

  const auto result = driver.Open();
  assert(!result);
  assert(result.code == DriverCode::kDeviceUnavailable);
  assert(result.Describe() == "device_unavailable: no such device");
}

void TestHungCallTimesOutAndBlocksFurtherCalls() {
  auto fake          = std::make_shared<bookrec::test::FakeCameraDriver>();
  fake->hang_on_open = 400ms;
  BoundedCameraDriver driver(fake, 50ms);

  const auto opened = driver.Open();
  assert(opened.code == DriverCode::kTimeout);

  // the hung open still owns the device
  const auto busy = driver.Close();
  assert(busy.code == DriverCode::kBusy);

  std::this_thread::sleep_for(600ms);
  assert(driver.Close());
}

void TestZeroTimeoutRunsInline() {
  auto fake = std::make_shared<bookrec::test::FakeCameraDriver>();
  BoundedCameraDriver driver(fake, 0ms);
  assert(driver.Open());
  assert(fake->open_calls == 1);
}

void TestArtifactNamingRoundTrip() {
  const auto started = bookrec::test::ReferenceInstant() + 7s;
  const auto path    = bookrec::camera::ArtifactPath("/data/rec", "cam-front", "b-42_x", started);
  assert(path == std::filesystem::path("/data/rec/cam-front/recording_20240514_140007_b-42_x.mp4"));

  const auto parsed = bookrec::camera::ParseArtifactPath(path);
  assert(parsed);
  assert(parsed->camera_id == "cam-front");
  assert(parsed->booking_id == "b-42_x");
  assert(parsed->started_at == started);
}

void TestArtifactNamingRejects() {
  assert(!bookrec::camera::ParseArtifactPath("/data/rec/cam-front/notes.txt"));
  assert(!bookrec::camera::ParseArtifactPath("/data/rec/cam-front/recording_2024_b-1.mp4"));
  assert(!bookrec::camera::ParseArtifactPath("/data/rec/cam-front/recording_20241399_000000_b-1.mp4"));
  assert(!bookrec::camera::ParseArtifactPath("/data/rec/cam-front/recording_20240514_140000_.mp4"));

  bool threw = false;
  try {
    (void)bookrec::camera::ArtifactPath("/data/rec", "cam-front", "../escape", bookrec::test::ReferenceInstant());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "booking ids must not escape the camera directory");
}

} // namespace

int main() {
  TestCallsPassThroughWithinTimeout();
  TestFailureCodesAreKept();
  TestHungCallTimesOutAndBlocksFurtherCalls();
  TestZeroTimeoutRunsInline();
  TestArtifactNamingRoundTrip();
  TestArtifactNamingRejects();

  std::cout << "booking_recorder_unit_camera_driver: pass\n";
  return 0;
}
