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

using jobguard::factory::Build;
using jobguard::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  jobguard::observability::ShutdownLogging();
  jobguard::observability::ShutdownMetrics();
  jobguard::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: jobguard <config.yaml> OR jobguard --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobguard::config::ConfigLoader::LoadFromYaml(config_path);

    jobguard::observability::InitializeTracing(config);
    jobguard::observability::InitializeMetrics(config);
    jobguard::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    JOBGUARD_LOG_INFO("jobguard started", {jobguard::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    JOBGUARD_LOG_INFO("Shutting down jobguard");

    server.Stop();
    for (auto& worker : app.background_workers) worker->Stop();
    app.coordinator->StopAll();

    ShutdownObservability();
  } catch (const std::exception& e) {
    JOBGUARD_LOG_ERROR("Fatal error", {jobguard::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
