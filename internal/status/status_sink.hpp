#pragma once

#include <string>

#include "bookrec/v1.hpp"
#include "internal/db/api/result.hpp"

namespace bookrec::status {

/*
  Destination for per-camera health snapshots. One Write per camera per
  heartbeat; implementations keep the latest value (upsert) or append.
*/
class StatusSink {
 public:
  virtual ~StatusSink() = default;

  virtual db::Result Write(const std::string& camera_id, const bookrec::v1::CameraStatus& status) = 0;
};

} // namespace bookrec::status
