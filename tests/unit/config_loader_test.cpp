#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

constexpr const char* kMinimal = R"(node:
  node_id: "studio-a-pi"
  recordings_dir: "/tmp/booking_recorder/recordings"
cameras:
  - camera_id: "cam-front"
    device: "0"
schedule:
  timezone: "UTC-4"
artifact_store:
  uri: "file:///mnt/share/recordings"
)";

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "booking_recorder_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  try {
    (void)bookrec::config::ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml_content).string());
  } catch (const bookrec::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  auto config = bookrec::config::ConfigLoader::LoadFromYaml(WriteYaml("minimal", kMinimal).string());

  // quoted device index stays a string
  assert(config.cameras(0).device() == "0");
  assert(config.cameras(0).fps() == 30);
  assert(config.cameras(0).fourcc() == "mp4v");
  assert(config.cameras(0).call_timeout_ms() == 10000);

  assert(config.schedule().poll_interval_ms() == 5000);
  assert(config.schedule().lookahead_minutes() == 60);
  assert(config.backoff().initial_delay_ms() == 2000);
  assert(config.backoff().max_delay_ms() == 30000);

  assert(config.upload().max_attempts() == 3);
  assert(config.upload().delete_after_upload());
  assert(config.upload().recover_orphans());
  assert(config.upload().uploaded_retention_minutes() == 60);

  assert(config.status().heartbeat_interval_ms() == 3000);
  assert(config.status().sink() == bookrec::runtime::config::STATUS_SINK_FILE);
  assert(config.status().file_path() == "/tmp/booking_recorder/recordings/status.jsonl");
  assert(config.logging().level() == "info");
}

void TestExplicitFalseIsKept() {
  auto config = bookrec::config::ConfigLoader::LoadFromYaml(WriteYaml("explicit_false", std::string(kMinimal) + R"(upload:
  delete_after_upload: false
  recover_orphans: false
)").string());
  assert(!config.upload().delete_after_upload());
  assert(!config.upload().recover_orphans());
}

void TestFullConfig() {
  auto config = bookrec::config::ConfigLoader::LoadFromYaml(WriteYaml("full", R"(node:
  node_id: "studio-a-pi"
  user_id: "studio-a"
  recordings_dir: "/var/lib/rec"
cameras:
  - camera_id: "cam-front"
    device: "/dev/video0"
    width: 1280
    height: 720
    fourcc: "MJPG"
  - camera_id: "cam-side"
    device: "/dev/video2"
schedule:
  timezone: "UTC+05:30"
backoff:
  initial_delay_ms: 500
  max_delay_ms: 8000
booking_source:
  postgres:
    connection_uri: "postgresql://recorder@db/bookings"
artifact_store:
  uri: "s3://bucket/raw"
  s3:
    region: "us-east-1"
    request_timeout_s: 60
status:
  sink: STATUS_SINK_POSTGRES
server:
  bind_address: "127.0.0.1:50061"
)").string());

  assert(config.cameras_size() == 2);
  assert(config.cameras(0).width() == 1280);
  assert(config.cameras(0).fourcc() == "MJPG");
  assert(config.booking_source().postgres().max_connections() == 4);
  assert(config.booking_source().postgres().statement_timeout_ms() == 10000);
  assert(config.artifact_store().s3().request_timeout_s() == 60.0);
  assert(config.status().sink() == bookrec::runtime::config::STATUS_SINK_POSTGRES);
  assert(config.server().bind_address() == "127.0.0.1:50061");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = bookrec::config::ConfigLoader::LoadFromYaml(WriteYaml("quoted_backslash", std::string(kMinimal) + R"(upload:
  task_store_path: "C:\\recorder\\\"quoted\"\\tasks.sqlite"
)").string());
  assert(config.upload().task_store_path() == "C:\\recorder\\\"quoted\"\\tasks.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", std::string(kMinimal) + "unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
}

void TestValidationFailures() {
  assert(Rejects("malformed_yaml", "node: [unterminated"));

  assert(Rejects("no_cameras", R"(node:
  node_id: "n"
  recordings_dir: "/tmp/r"
schedule:
  timezone: "UTC"
artifact_store:
  uri: "/mnt/share"
)"));

  assert(Rejects("duplicate_camera", R"(node:
  node_id: "n"
  recordings_dir: "/tmp/r"
cameras:
  - camera_id: "cam"
    device: "0"
  - camera_id: "cam"
    device: "1"
schedule:
  timezone: "UTC"
artifact_store:
  uri: "/mnt/share"
)"));

  assert(Rejects("bad_camera_id", R"(node:
  node_id: "n"
  recordings_dir: "/tmp/r"
cameras:
  - camera_id: "../cam"
    device: "0"
schedule:
  timezone: "UTC"
artifact_store:
  uri: "/mnt/share"
)"));

  assert(Rejects("bad_zone", R"(node:
  node_id: "n"
  recordings_dir: "/tmp/r"
cameras:
  - camera_id: "cam"
    device: "0"
schedule:
  timezone: "Nowhere/Special"
artifact_store:
  uri: "/mnt/share"
)"));

  assert(Rejects("inverted_backoff", std::string(kMinimal) + R"(backoff:
  initial_delay_ms: 5000
  max_delay_ms: 1000
)"));

  assert(Rejects("pg_sink_without_pg", std::string(kMinimal) + R"(status:
  sink: STATUS_SINK_POSTGRES
)"));

  assert(Rejects("missing_store", R"(node:
  node_id: "n"
  recordings_dir: "/tmp/r"
cameras:
  - camera_id: "cam"
    device: "0"
schedule:
  timezone: "UTC"
)"));

  bool threw = false;
  try {
    (void)bookrec::config::ConfigLoader::LoadFromYaml("/nonexistent/booking-recorder.yaml");
  } catch (const bookrec::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestExplicitFalseIsKept();
  TestFullConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestValidationFailures();

  std::cout << "booking_recorder_unit_config_loader: pass\n";
  return 0;
}
