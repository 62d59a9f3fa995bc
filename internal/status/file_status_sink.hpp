#pragma once

#include <filesystem>
#include <mutex>

#include "status_sink.hpp"

namespace bookrec::status {

/*
  Appends one JSON object per write to a local file (JSON lines), for
  nodes without a database.
*/
class FileStatusSink final : public StatusSink {
 public:
  explicit FileStatusSink(std::filesystem::path path);

  db::Result Write(const std::string& camera_id, const bookrec::v1::CameraStatus& status) override;

 private:
  std::filesystem::path path_;
  std::mutex            mutex_;
};

} // namespace bookrec::status
