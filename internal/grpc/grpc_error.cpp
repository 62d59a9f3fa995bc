#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace bookrec::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace bookrec::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const ConfigError*>(&e) || dynamic_cast<const InvalidBooking*>(&e) || dynamic_cast<const InvalidTimeFormat*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ResourceConflictError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const TransientSourceError*>(&e) || dynamic_cast<const UploadError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace bookrec::grpc
