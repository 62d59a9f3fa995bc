#include "status_server.hpp"

#include "grpc_error.hpp"

namespace bookrec::grpc {

StatusServer::StatusServer(std::shared_ptr<bookrec::service::StatusService> svc) : service_(std::move(svc)) {
}

::grpc::Status StatusServer::GetStatus(::grpc::ServerContext*, const bookrec::v1::GetStatusRequest* req, bookrec::v1::GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace bookrec::grpc
