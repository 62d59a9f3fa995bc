#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/booking/booking_poller.hpp"
#include "internal/booking/booking_source.hpp"
#include "internal/camera/camera_driver.hpp"
#include "internal/camera/camera_lifecycle.hpp"
#include "internal/status/status_reporter.hpp"
#include "internal/status/status_sink.hpp"
#include "internal/upload/artifact_store.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/upload/upload_worker.hpp"
#include "internal/util/time.hpp"

namespace bookrec::factory {

using DriverFactory = std::function<std::shared_ptr<camera::CameraDriver>(const bookrec::runtime::config::CameraConfig&)>;

/*
  Replacements for the concrete backends, used by tests and tools. Any
  member left empty is built from the configuration.
*/
struct Overrides {
  std::shared_ptr<util::ClockSource>      clock;
  std::shared_ptr<booking::BookingSource> bookings;
  std::shared_ptr<upload::ArtifactStore>  artifact_store;
  std::shared_ptr<status::StatusSink>     status_sink;
  DriverFactory                           driver_factory;
};

/*
  Application

  Owns every long-lived component. Start() launches the loops; Stop()
  shuts them down in dependency order:

      poller -> cameras (active sessions finalized) -> upload drain
             -> final status report
*/
struct Application {
  std::shared_ptr<util::ClockSource>                    clock;
  std::shared_ptr<booking::BookingSource>               bookings;
  std::shared_ptr<upload::UploadQueue>                  uploads;
  std::shared_ptr<upload::UploadWorkerPool>             workers;
  std::vector<std::shared_ptr<camera::CameraLifecycle>> cameras;
  std::shared_ptr<booking::BookingPoller>               poller;
  std::shared_ptr<status::StatusReporter>               reporter;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::chrono::milliseconds drain_timeout{10000};

  void Start();
  void Stop();
};

/*
  Build

  Composition root. The ONLY place that knows concrete backend types.
  Throws util::ConfigError when the configuration asks for a backend this
  build does not include.
*/
Application Build(const bookrec::runtime::config::RuntimeConfig& config, Overrides overrides = {});

} // namespace bookrec::factory
