#pragma once

#include <memory>

#include "internal/db/postgres/pg_pool.hpp"
#include "status_sink.hpp"

namespace bookrec::status {

// Upserts one system_status row per camera.
class PgStatusSink final : public StatusSink {
 public:
  explicit PgStatusSink(std::shared_ptr<db::postgres::PgPool> pool);

  db::Result Write(const std::string& camera_id, const bookrec::v1::CameraStatus& status) override;

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};

} // namespace bookrec::status
