#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using bookrec::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  bookrec::observability::ShutdownLogging();
  bookrec::observability::ShutdownMetrics();
  bookrec::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: booking-recorder <config.yaml> OR booking-recorder --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = bookrec::config::ConfigLoader::LoadFromYaml(config_path);

    bookrec::observability::InitializeTracing(config);
    bookrec::observability::InitializeMetrics(config);
    bookrec::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = bookrec::factory::Build(config);

    std::unique_ptr<Server> server;
    if (!config.server().bind_address().empty()) {
      server = std::make_unique<Server>(config.server().bind_address(), std::move(app.grpc_services));
    }

    // Register signal handlers before starting anything to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    if (server) {
      server->Start();
    }
    BOOKREC_LOG_INFO("Booking recorder started", {bookrec::observability::StringField("node_id", config.node().node_id()),
                                                  bookrec::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BOOKREC_LOG_INFO("Shutting down booking recorder");

    if (server) {
      server->Stop();
    }
    app.Stop();
    ShutdownObservability();
  } catch (const bookrec::util::ConfigError& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    ShutdownObservability();
    return 2;
  } catch (const std::exception& e) {
    BOOKREC_LOG_ERROR("Fatal error", {bookrec::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
