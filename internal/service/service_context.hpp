#pragma once

#include <memory>

namespace bookrec::status {
class StatusReporter;
}

namespace bookrec::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<bookrec::status::StatusReporter> reporter;
};

} // namespace bookrec::service
