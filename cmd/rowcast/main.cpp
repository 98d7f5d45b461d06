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

using rowcast::factory::Build;
using rowcast::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  rowcast::observability::ShutdownLogging();
  rowcast::observability::ShutdownMetrics();
  rowcast::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: rowcast <config.yaml> OR rowcast --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rowcast::config::ConfigLoader::LoadFromYaml(config_path);

    rowcast::observability::InitializeTracing(config);
    rowcast::observability::InitializeMetrics(config);
    rowcast::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server + pipeline
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.worker->Start();
    ROWCAST_LOG_INFO("rowcast started", {rowcast::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROWCAST_LOG_INFO("Shutting down rowcast");

    app.worker->Stop();
    app.hub->CloseAll();
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ROWCAST_LOG_ERROR("Fatal error", {rowcast::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
