#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>

#include "internal/schedule/time_window_normalizer.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace bookrec::config {

using bookrec::runtime::config::RuntimeConfig;
using bookrec::util::ConfigError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0" for a device index)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  for (auto& camera : *config.mutable_cameras()) {
    if (camera.width() == 0) camera.set_width(1920);
    if (camera.height() == 0) camera.set_height(1080);
    if (camera.fps() == 0) camera.set_fps(30);
    if (camera.fourcc().empty()) camera.set_fourcc("mp4v");
    if (camera.call_timeout_ms() == 0) camera.set_call_timeout_ms(10000);
    if (camera.tick_interval_ms() == 0) camera.set_tick_interval_ms(500);
  }

  auto* schedule = config.mutable_schedule();
  if (schedule->timezone().empty()) schedule->set_timezone("America/New_York");
  if (schedule->poll_interval_ms() == 0) schedule->set_poll_interval_ms(5000);
  if (schedule->lookahead_minutes() == 0) schedule->set_lookahead_minutes(60);
  if (schedule->max_booking_age_hours() == 0) schedule->set_max_booking_age_hours(24);

  auto* backoff = config.mutable_backoff();
  if (backoff->initial_delay_ms() == 0) backoff->set_initial_delay_ms(2000);
  if (backoff->max_delay_ms() == 0) backoff->set_max_delay_ms(30000);

  auto* upload = config.mutable_upload();
  if (upload->workers() == 0) upload->set_workers(1);
  if (upload->max_attempts() == 0) upload->set_max_attempts(3);
  if (upload->queue_capacity() == 0) upload->set_queue_capacity(64);
  if (!upload->has_delete_after_upload()) upload->set_delete_after_upload(true);
  if (!upload->has_recover_orphans()) upload->set_recover_orphans(true);
  if (upload->uploaded_retention_minutes() == 0) upload->set_uploaded_retention_minutes(60);

  if (config.booking_source().has_postgres()) {
    auto* postgres = config.mutable_booking_source()->mutable_postgres();
    if (postgres->max_connections() == 0) postgres->set_max_connections(4);
    if (postgres->statement_timeout_ms() == 0) postgres->set_statement_timeout_ms(10000);
  }

  auto* status = config.mutable_status();
  if (status->heartbeat_interval_ms() == 0) status->set_heartbeat_interval_ms(3000);
  if (status->sink() == bookrec::runtime::config::STATUS_SINK_UNSPECIFIED) {
    status->set_sink(bookrec::runtime::config::STATUS_SINK_FILE);
  }
  if (status->sink() == bookrec::runtime::config::STATUS_SINK_FILE && status->file_path().empty() && !config.node().recordings_dir().empty()) {
    status->set_file_path((std::filesystem::path(config.node().recordings_dir()) / "status.jsonl").string());
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.node().node_id().empty()) {
    throw ConfigError("node.node_id is required");
  }
  if (config.node().recordings_dir().empty()) {
    throw ConfigError("node.recordings_dir is required");
  }
  if (config.cameras().empty()) {
    throw ConfigError("at least one camera must be configured");
  }

  std::set<std::string> camera_ids;
  for (const auto& camera : config.cameras()) {
    try {
      storage::common::ValidatePathComponent(camera.camera_id(), "camera_id");
    } catch (const std::invalid_argument& e) {
      throw ConfigError(std::string("cameras: ") + e.what());
    }
    if (!camera_ids.insert(camera.camera_id()).second) {
      throw ConfigError("cameras: duplicate camera_id '" + camera.camera_id() + "'");
    }
    if (camera.device().empty()) {
      throw ConfigError("cameras: device is required for camera '" + camera.camera_id() + "'");
    }
    if (camera.fourcc().size() != 4) {
      throw ConfigError("cameras: fourcc must be four characters for camera '" + camera.camera_id() + "'");
    }
  }

  // throws ConfigError for an unknown zone
  schedule::TimeWindowNormalizer::LoadReferenceZone(config.schedule().timezone());

  if (config.backoff().max_delay_ms() < config.backoff().initial_delay_ms()) {
    throw ConfigError("backoff.max_delay_ms must not be below backoff.initial_delay_ms");
  }

  if (config.artifact_store().uri().empty()) {
    throw ConfigError("artifact_store.uri is required");
  }

  if (config.booking_source().has_postgres() && config.booking_source().postgres().connection_uri().empty()) {
    throw ConfigError("booking_source.postgres.connection_uri is required");
  }

  switch (config.status().sink()) {
    case bookrec::runtime::config::STATUS_SINK_POSTGRES:
      if (!config.booking_source().has_postgres()) {
        throw ConfigError("status.sink POSTGRES requires booking_source.postgres");
      }
      break;
    case bookrec::runtime::config::STATUS_SINK_FILE:
      if (config.status().file_path().empty()) {
        throw ConfigError("status.file_path is required for the file sink");
      }
      break;
    default:
      throw ConfigError("status.sink is not set");
  }
}

} // namespace bookrec::config
