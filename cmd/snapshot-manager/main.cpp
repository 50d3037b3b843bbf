#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using snapshot::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void Shutdown() {
  snapshot::observability::ShutdownLogging();
  snapshot::observability::ShutdownMetrics();
  snapshot::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: snapshot-manager <config.yaml> OR snapshot-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = snapshot::config::ConfigLoader::LoadFromYaml(config_path);

    snapshot::observability::InitializeTracing(config);
    snapshot::observability::InitializeMetrics(config);
    snapshot::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = snapshot::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SNAPSHOT_LOG_INFO("Snapshot Manager started", {snapshot::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SNAPSHOT_LOG_INFO("Shutting down snapshot manager");

    server.Stop();
    for (auto& worker : app.background_workers) {
      worker->Stop();
    }
    Shutdown();
  } catch (const std::exception& e) {
    SNAPSHOT_LOG_ERROR("Fatal error", {snapshot::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
