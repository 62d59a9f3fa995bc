#include "status_service.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/status/status_reporter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace bookrec::service {

using namespace bookrec::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

StatusService::StatusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetStatusResponse StatusService::GetStatus(const GetStatusRequest& req) {
  bookrec::observability::SpanScope span("StatusService.GetStatus");
  const auto                        started_at = std::chrono::steady_clock::now();

  try {
    GetStatusResponse resp;
    if (req.camera_id().empty()) {
      *resp.mutable_status() = ctx_.reporter->Collect();
    } else {
      auto camera = ctx_.reporter->CollectCamera(req.camera_id());
      if (!camera) {
        throw util::NotFound("camera " + req.camera_id() + " is not managed by this node");
      }
      auto* status = resp.mutable_status();
      status->set_node_id(camera->node_id());
      *status->add_cameras()    = *camera;
      *status->mutable_taken_at() = camera->last_heartbeat();
    }

    bookrec::observability::Metrics::Instance().RecordRequest("StatusService.GetStatus", true);
    bookrec::observability::Metrics::Instance().ObserveRequestLatencyMs("StatusService.GetStatus", ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BOOKREC_LOG_ERROR("RPC failed", {bookrec::observability::StringField("route", "StatusService.GetStatus"),
                                     bookrec::observability::StringField("error", ex.what())});
    bookrec::observability::Metrics::Instance().RecordRequest("StatusService.GetStatus", false);
    bookrec::observability::Metrics::Instance().ObserveRequestLatencyMs("StatusService.GetStatus", ElapsedMs(started_at));
    throw;
  }
}

} // namespace bookrec::service
