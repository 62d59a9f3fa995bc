#include "factory.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/booking/memory_booking_source.hpp"
#include "internal/camera/bounded_camera_driver.hpp"
#include "internal/grpc/status_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/time_window_normalizer.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/status_service.hpp"
#include "internal/status/file_status_sink.hpp"
#include "internal/upload/orphan_recovery.hpp"
#include "internal/util/errors.hpp"
#if BOOKREC_CAMERA_OPENCV
#include "internal/camera/opencv_camera_driver.hpp"
#endif
#if BOOKREC_STORE_ARROW
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/object/arrow_artifact_store.hpp"
#endif
#if BOOKREC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_upload_task_store.hpp"
#endif
#if BOOKREC_DB_POSTGRES
#include "internal/booking/pg_booking_source.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/status/pg_status_sink.hpp"
#endif

namespace bookrec::factory {

using bookrec::runtime::config::RuntimeConfig;
using observability::StringField;
using util::ConfigError;

namespace {

std::shared_ptr<camera::CameraDriver> BuildDriver(const bookrec::runtime::config::CameraConfig& camera) {
#if BOOKREC_CAMERA_OPENCV
  return std::make_shared<camera::OpenCvCameraDriver>(camera.device());
#else
  throw ConfigError("camera '" + camera.camera_id() + "' needs the OpenCV driver, which is not enabled at build time");
#endif
}

std::shared_ptr<upload::ArtifactStore> BuildArtifactStore(const RuntimeConfig& config) {
#if BOOKREC_STORE_ARROW
  auto resolved = storage::common::ResolveFileSystem(config.artifact_store());
  if (!resolved.ok()) {
    throw ConfigError("artifact_store.uri '" + config.artifact_store().uri() + "': " + resolved.status().ToString());
  }
  auto [fs, root] = resolved.MoveValueUnsafe();
  return std::make_shared<storage::ArrowArtifactStore>(std::move(fs), std::move(root));
#else
  (void)config;
  throw ConfigError("arrow artifact store requested but not enabled at build time");
#endif
}

std::shared_ptr<upload::UploadTaskStore> BuildTaskStore(const RuntimeConfig& config) {
  const auto& path = config.upload().task_store_path();
  if (path.empty()) {
    return nullptr;
  }
#if BOOKREC_DB_SQLITE
  try {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    return std::make_shared<db::sqlite::SqliteUploadTaskStore>(std::move(sqlite_db));
  } catch (const std::runtime_error& e) {
    throw ConfigError("upload.task_store_path: " + std::string(e.what()));
  }
#else
  throw ConfigError("sqlite task store requested but not enabled at build time");
#endif
}

} // namespace

// ------------------------------------------------------------------
// Application
// ------------------------------------------------------------------

void Application::Start() {
  workers->Start();
  for (auto& camera : cameras) {
    camera->Start();
  }
  poller->Start();
  reporter->Start();
}

void Application::Stop() {
  poller->Stop();

  for (auto& camera : cameras) {
    camera->Stop();
    camera->Shutdown();
  }

  const auto deadline = std::chrono::steady_clock::now() + drain_timeout;
  while (uploads->HasActive() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (uploads->HasActive()) {
    BOOKREC_LOG_WARN("Uploads still pending at shutdown, they resume on next start");
  }
  workers->Stop();

  reporter->Stop();
  reporter->ReportOnce();

#if BOOKREC_STORE_ARROW
  storage::common::FinalizeFileSystems();
#endif
}

// ------------------------------------------------------------------
// Build
// ------------------------------------------------------------------

Application Build(const RuntimeConfig& config, Overrides overrides) {
  Application app;
  app.clock = overrides.clock ? overrides.clock : std::make_shared<util::SystemClock>();

  const std::filesystem::path recordings_dir(config.node().recordings_dir());
  std::error_code             ec;
  std::filesystem::create_directories(recordings_dir, ec);
  if (ec) {
    throw ConfigError("node.recordings_dir '" + recordings_dir.string() + "': " + ec.message());
  }

  // ------------------------------------------------------------------
  // Booking source
  // ------------------------------------------------------------------
#if BOOKREC_DB_POSTGRES
  std::shared_ptr<db::postgres::PgPool> pool;
#endif
  if (overrides.bookings) {
    app.bookings = overrides.bookings;
  } else if (config.booking_source().has_postgres()) {
#if BOOKREC_DB_POSTGRES
    const auto& postgres = config.booking_source().postgres();
    pool = std::make_shared<db::postgres::PgPool>(db::postgres::BuildConninfo(postgres.connection_uri(), postgres.statement_timeout_ms()),
                                                  postgres.max_connections());
    try {
      pool->Bootstrap();
    } catch (const pqxx::failure& e) {
      // the poller keeps retrying; schema is assumed to match until then
      BOOKREC_LOG_WARN("Booking database not reachable at startup", {StringField("error", e.what())});
    }
    app.bookings = std::make_shared<booking::PgBookingSource>(pool);
#else
    throw ConfigError("postgres booking source requested but not enabled at build time");
#endif
  } else {
    BOOKREC_LOG_WARN("No booking source configured, using the in-memory source");
    app.bookings = std::make_shared<booking::MemoryBookingSource>();
  }

  // ------------------------------------------------------------------
  // Upload pipeline
  // ------------------------------------------------------------------
  const auto& upload_config = config.upload();
  app.uploads = std::make_shared<upload::UploadQueue>(upload_config.queue_capacity(), app.clock, BuildTaskStore(config));
  try {
    app.uploads->Hydrate();
  } catch (const std::runtime_error& e) {
    BOOKREC_LOG_ERROR("Upload task store could not be read", {StringField("error", e.what())});
  }

  upload::UploadSettings upload_settings;
  upload_settings.workers                    = upload_config.workers();
  upload_settings.max_attempts               = upload_config.max_attempts();
  upload_settings.delete_after_upload        = upload_config.delete_after_upload();
  upload_settings.retry_policy.initial_delay = std::chrono::milliseconds(config.backoff().initial_delay_ms());
  upload_settings.retry_policy.max_delay     = std::chrono::milliseconds(config.backoff().max_delay_ms());
  upload_settings.uploaded_retention         = std::chrono::minutes(upload_config.uploaded_retention_minutes());

  auto artifact_store = overrides.artifact_store ? overrides.artifact_store : BuildArtifactStore(config);
  app.workers         = std::make_shared<upload::UploadWorkerPool>(upload_settings, app.uploads, artifact_store, app.bookings, app.clock);

  // ------------------------------------------------------------------
  // Cameras
  // ------------------------------------------------------------------
  backoff::BackoffPolicy policy;
  policy.initial_delay = std::chrono::milliseconds(config.backoff().initial_delay_ms());
  policy.max_delay     = std::chrono::milliseconds(config.backoff().max_delay_ms());

  std::vector<std::string> camera_ids;
  for (const auto& camera_config : config.cameras()) {
    auto driver = overrides.driver_factory ? overrides.driver_factory(camera_config) : BuildDriver(camera_config);
    auto bounded =
        std::make_shared<camera::BoundedCameraDriver>(std::move(driver), std::chrono::milliseconds(camera_config.call_timeout_ms()));

    camera::CameraSettings settings;
    settings.camera_id      = camera_config.camera_id();
    settings.recordings_dir = recordings_dir;
    settings.format         = {camera_config.width(), camera_config.height(), camera_config.fps(), camera_config.fourcc()};
    settings.tick_interval  = std::chrono::milliseconds(camera_config.tick_interval_ms());

    app.cameras.push_back(std::make_shared<camera::CameraLifecycle>(std::move(settings), std::move(bounded), app.bookings, app.uploads, policy, app.clock));
    camera_ids.push_back(camera_config.camera_id());
  }

  if (upload_config.recover_orphans()) {
    upload::RecoverOrphans(recordings_dir, camera_ids, config.node().user_id(), *app.uploads);
  }

  // ------------------------------------------------------------------
  // Poller
  // ------------------------------------------------------------------
  booking::PollerSettings poller_settings;
  poller_settings.user_id         = config.node().user_id();
  poller_settings.poll_interval   = std::chrono::milliseconds(config.schedule().poll_interval_ms());
  poller_settings.lookahead       = std::chrono::minutes(config.schedule().lookahead_minutes());
  poller_settings.max_booking_age = std::chrono::hours(config.schedule().max_booking_age_hours());

  schedule::TimeWindowNormalizer normalizer(schedule::TimeWindowNormalizer::LoadReferenceZone(config.schedule().timezone()));
  app.poller = std::make_shared<booking::BookingPoller>(poller_settings, app.bookings, normalizer, app.cameras, app.uploads, app.clock);

  // ------------------------------------------------------------------
  // Status
  // ------------------------------------------------------------------
  std::shared_ptr<status::StatusSink> sink = overrides.status_sink;
  if (!sink) {
    if (config.status().sink() == bookrec::runtime::config::STATUS_SINK_POSTGRES) {
#if BOOKREC_DB_POSTGRES
      if (!pool) {
        throw ConfigError("status.sink POSTGRES requires the postgres booking source");
      }
      sink = std::make_shared<status::PgStatusSink>(pool);
#else
      throw ConfigError("postgres status sink requested but not enabled at build time");
#endif
    } else {
      sink = std::make_shared<status::FileStatusSink>(config.status().file_path());
    }
  }

  status::ReporterSettings reporter_settings;
  reporter_settings.node_id            = config.node().node_id();
  reporter_settings.user_id            = config.node().user_id();
  reporter_settings.recordings_dir     = recordings_dir;
  reporter_settings.heartbeat_interval = std::chrono::milliseconds(config.status().heartbeat_interval_ms());
  app.reporter = std::make_shared<status::StatusReporter>(reporter_settings, app.cameras, app.uploads, sink, app.clock);

  // ------------------------------------------------------------------
  // gRPC services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.reporter = app.reporter;
  app.grpc_services.push_back(std::make_unique<grpc::StatusServer>(std::make_shared<service::StatusService>(ctx)));

  BOOKREC_LOG_INFO("Application built", {StringField("node_id", config.node().node_id()),
                                         observability::IntField("cameras", static_cast<std::int64_t>(app.cameras.size())),
                                         StringField("timezone", config.schedule().timezone())});
  return app;
}

} // namespace bookrec::factory
