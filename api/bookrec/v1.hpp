#pragma once

#include "bookrec/status/v1/status.pb.h"
#include "bookrec/status/v1/status.grpc.pb.h"

namespace bookrec::v1 {
using namespace ::bookrec::status::v1;
}
