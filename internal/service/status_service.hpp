#pragma once

#include "bookrec/v1.hpp"
#include "service_context.hpp"

namespace bookrec::service {

class StatusService {
 public:
  explicit StatusService(ServiceContext ctx);

  // Throws util::NotFound for a camera this node does not manage.
  bookrec::v1::GetStatusResponse GetStatus(const bookrec::v1::GetStatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace bookrec::service
