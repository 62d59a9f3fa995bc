#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "bookrec/v1.hpp"
#include "internal/service/status_service.hpp"

namespace bookrec::grpc {

class StatusServer final : public bookrec::v1::StatusService::Service {
 public:
  explicit StatusServer(std::shared_ptr<bookrec::service::StatusService> svc);

  ::grpc::Status GetStatus(::grpc::ServerContext*, const bookrec::v1::GetStatusRequest*, bookrec::v1::GetStatusResponse*) override;

 private:
  std::shared_ptr<bookrec::service::StatusService> service_;
};

} // namespace bookrec::grpc
