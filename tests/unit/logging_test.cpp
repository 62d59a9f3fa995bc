#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {

using bookrec::observability::BoolField;
using bookrec::observability::IntField;
using bookrec::observability::ScopedLogContext;
using bookrec::observability::StringField;

struct Capture {
  std::ostringstream out;

  Capture() {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("logging_test", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }

  std::string Take() {
    auto line = out.str();
    out.str({});
    if (!line.empty() && line.back() == '\n') line.pop_back();
    return line;
  }
};

void TestFieldsFollowMessage() {
  Capture capture;
  BOOKREC_LOG_INFO("Recording started", {StringField("camera_id", "cam-front"), IntField("test_frame_bytes", 16), BoolField("canceled", false)});
  assert(capture.Take() == "Recording started camera_id=cam-front test_frame_bytes=16 canceled=false");

  BOOKREC_LOG_WARN("Booking source unavailable");
  assert(capture.Take() == "Booking source unavailable");
}

void TestValuesWithSpacesAreQuoted() {
  Capture capture;
  BOOKREC_LOG_WARN("Camera initialization failed", {StringField("error", "device_unavailable: no \"video0\""), StringField("reason", "")});
  assert(capture.Take() == R"(Camera initialization failed error="device_unavailable: no \"video0\"" reason="")");
}

void TestScopedContextIsAppendedAndNests() {
  Capture capture;
  {
    ScopedLogContext camera({StringField("camera_id", "cam-front")});
    BOOKREC_LOG_INFO("Camera tick");
    assert(capture.Take() == "Camera tick camera_id=cam-front");

    {
      ScopedLogContext booking({StringField("booking_id", "b-1")});
      BOOKREC_LOG_INFO("Recording finalized", {IntField("duration_s", 60)});
      assert(capture.Take() == "Recording finalized duration_s=60 camera_id=cam-front booking_id=b-1");

      // explicit fields win over context fields
      BOOKREC_LOG_INFO("Booking accepted", {StringField("booking_id", "b-2")});
      assert(capture.Take() == "Booking accepted booking_id=b-2 camera_id=cam-front");
    }

    BOOKREC_LOG_INFO("Camera idle");
    assert(capture.Take() == "Camera idle camera_id=cam-front");
  }

  BOOKREC_LOG_INFO("Poller started");
  assert(capture.Take() == "Poller started");
}

void TestContextIsPerThread() {
  Capture          capture;
  ScopedLogContext camera({StringField("camera_id", "cam-front")});

  std::thread other([] { BOOKREC_LOG_INFO("Upload worker idle"); });
  other.join();
  assert(capture.Take() == "Upload worker idle");
}

void TestNodeIdIsAppendedLast() {
  Capture capture;
  bookrec::observability::SetLogNodeId("studio-a-pi");
  {
    ScopedLogContext booking({StringField("booking_id", "b-1")});
    BOOKREC_LOG_ERROR("Artifact upload failed permanently", {StringField("path", "/tmp/b-1.mp4")});
  }
  assert(capture.Take() == "Artifact upload failed permanently path=/tmp/b-1.mp4 booking_id=b-1 node=studio-a-pi");
  bookrec::observability::SetLogNodeId("");

  BOOKREC_LOG_INFO("Shutdown complete");
  assert(capture.Take() == "Shutdown complete");
}

} // namespace

int main() {
  TestFieldsFollowMessage();
  TestValuesWithSpacesAreQuoted();
  TestScopedContextIsAppendedAndNests();
  TestContextIsPerThread();
  TestNodeIdIsAppendedLast();

  std::cout << "booking_recorder_unit_logging: pass\n";
  return 0;
}
