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
#include "internal/scheduler/delayed_job_worker.hpp"

using checkout::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  checkout::observability::ShutdownLogging();
  checkout::observability::ShutdownMetrics();
  checkout::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: checkout-manager <config.yaml> OR checkout-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = checkout::config::ConfigLoader::LoadFromYaml(config_path);

    checkout::observability::InitializeTracing(config);
    checkout::observability::InitializeMetrics(config);
    checkout::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = checkout::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CHECKOUT_LOG_INFO("Checkout manager started", {checkout::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHECKOUT_LOG_INFO("Shutting down checkout manager");

    server.Stop();
    app.worker->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    CHECKOUT_LOG_ERROR("Fatal error", {checkout::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
