#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/bus/bus_client.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using dispatch::factory::Build;
using dispatch::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  dispatch::observability::ShutdownLogging();
  dispatch::observability::ShutdownMetrics();
  dispatch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: rider-dispatch <config.yaml> OR rider-dispatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = dispatch::config::ConfigLoader::LoadFromYaml(config_path);

    dispatch::observability::InitializeTracing(config);
    dispatch::observability::InitializeMetrics(config);
    dispatch::observability::InitializeLogging(config);

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
    DISPATCH_LOG_INFO("Rider dispatch started", {dispatch::observability::StringField("bind_address", config.server().bind_address()),
                                                 dispatch::observability::StringField("node_id", config.server().node_id())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DISPATCH_LOG_INFO("Shutting down rider dispatch");

    // consumers first so no handler writes to a stream being torn down
    app.bus->Disconnect();
    app.forwarder.reset();
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("Fatal error", {dispatch::observability::ErrorField(e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
