#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using flowstore::runtime::Server;

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
    std::cerr << "Usage: flowstore <config.yaml> OR flowstore --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flowstore::config::ConfigLoader::LoadFromYaml(config_path);

    flowstore::observability::InitializeLogging(config);

    if (config.server().bind_address().empty()) {
      config.mutable_server()->set_bind_address("0.0.0.0:50061");
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = flowstore::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FLOWSTORE_LOG_INFO("flowstore started", {flowstore::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLOWSTORE_LOG_INFO("Shutting down flowstore");

    server.Stop();
    flowstore::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FLOWSTORE_LOG_ERROR("Fatal error", {flowstore::observability::StringField("error", e.what())});
    flowstore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
