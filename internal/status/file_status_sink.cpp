#include "file_status_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>

namespace bookrec::status {

FileStatusSink::FileStatusSink(std::filesystem::path path) : path_(std::move(path)) {
}

db::Result FileStatusSink::Write(const std::string& camera_id, const bookrec::v1::CameraStatus& status) {
  std::string                                line;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto converted = google::protobuf::util::MessageToJsonString(status, &line, options);
  if (!converted.ok()) {
    return db::Result::Err(db::ErrorCode::InternalError, "status for " + camera_id + ": " + std::string(converted.message()));
  }

  std::lock_guard lock(mutex_);

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }

  std::ofstream out(path_, std::ios::app);
  if (!out) {
    return db::Result::Err(db::ErrorCode::IOError, "cannot open " + path_.string());
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    return db::Result::Err(db::ErrorCode::IOError, "write to " + path_.string() + " failed");
  }
  return db::Result::Ok();
}

} // namespace bookrec::status
