#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/grpc/application.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using stagesync::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: stagesync <config.yaml> OR stagesync --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = stagesync::config::ConfigLoader::LoadFromYaml(config_path);

    stagesync::observability::InitializeTracing(config);
    stagesync::observability::InitializeMetrics(config);
    stagesync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app     = stagesync::grpc::Build(config);
    auto manager = app.engine.manager;

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    STAGESYNC_LOG_INFO("stagesync started", {stagesync::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STAGESYNC_LOG_INFO("Shutting down stagesync");

    server.Stop();
    if (app.engine.sync_task) app.engine.sync_task->Stop();
    // flushes dirty entries; undelivered queue entries stay in the journal
    manager->Destroy();

    stagesync::observability::ShutdownLogging();
    stagesync::observability::ShutdownMetrics();
    stagesync::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    STAGESYNC_LOG_ERROR("Fatal error", {stagesync::observability::StringField("error", e.what())});
    stagesync::observability::ShutdownLogging();
    stagesync::observability::ShutdownMetrics();
    stagesync::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
