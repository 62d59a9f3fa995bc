#include "pg_status_sink.hpp"

#include <google/protobuf/util/json_util.h>

namespace bookrec::status {

namespace {

std::string StateName(bookrec::v1::CameraState state) {
  switch (state) {
    case bookrec::v1::CAMERA_STATE_IDLE:
      return "idle";
    case bookrec::v1::CAMERA_STATE_INITIALIZING:
      return "initializing";
    case bookrec::v1::CAMERA_STATE_RECORDING:
      return "recording";
    case bookrec::v1::CAMERA_STATE_FINALIZING:
      return "finalizing";
    case bookrec::v1::CAMERA_STATE_FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

} // namespace

PgStatusSink::PgStatusSink(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
}

db::Result PgStatusSink::Write(const std::string& camera_id, const bookrec::v1::CameraStatus& status) {
  std::string                              snapshot;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  if (auto converted = google::protobuf::util::MessageToJsonString(status, &snapshot, options); !converted.ok()) {
    return db::Result::Err(db::ErrorCode::InternalError, std::string(converted.message()));
  }

  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("upsert_status", camera_id, status.node_id(), status.user_id(), status.is_recording(), StateName(status.state()),
                     status.active_booking_id(), static_cast<int>(status.consecutive_failures()), static_cast<int>(status.pending_uploads()),
                     static_cast<int>(status.failed_uploads()), static_cast<std::int64_t>(status.storage_used_bytes()), status.last_error(),
                     snapshot);
    tx.commit();
    return db::Result::Ok();
  } catch (const pqxx::broken_connection& e) {
    return db::Result::Err(db::ErrorCode::Unavailable, e.what());
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::InternalError, e.what());
  }
}

} // namespace bookrec::status
