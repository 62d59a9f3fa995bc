#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace bookrec::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace bookrec::grpc
