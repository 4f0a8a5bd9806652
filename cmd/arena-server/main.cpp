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

using arena::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  arena::observability::ShutdownLogging();
  arena::observability::ShutdownMetrics();
  arena::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: arena-server <config.yaml> OR arena-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = arena::config::ConfigLoader::LoadFromYaml(config_path);

    arena::observability::InitializeTracing(config);
    arena::observability::InitializeMetrics(config);
    arena::observability::InitializeLogging(config);

    auto app = arena::factory::Build(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061")
                                                                       : config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services));

    // Handlers go in before Start so an early signal is not lost.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ARENA_LOG_INFO("Arena server started", {arena::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ARENA_LOG_INFO("Shutting down arena server");

    server.Stop();
    // Cancels live runs and joins their threads.
    app.arena_service.reset();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ARENA_LOG_ERROR("Fatal error", {arena::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
