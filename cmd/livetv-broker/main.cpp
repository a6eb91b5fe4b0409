#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

using livetv::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void StopWorkers(livetv::factory::Application& app) {
  for (auto& worker : app.background_workers) {
    worker->Stop();
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: livetv-broker <config.yaml> OR livetv-broker --config <config.yaml>" << std::endl;
    return 1;
  }

  livetv::runtime::config::RuntimeConfig config;
  try {
    config = livetv::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "livetv-broker: " << e.what() << std::endl;
    return 1;
  }

  livetv::observability::InitializeLogging(config);
  livetv::observability::Telemetry telemetry(config);

  try {
    auto app = livetv::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
      server.Start();
    } catch (...) {
      StopWorkers(app);
      throw;
    }
    LIVETV_LOG_INFO("Tuner broker started", {livetv::observability::StringField("bind_address", config.server().bind_address()),
                                             livetv::observability::IntField("port", server.SelectedPort()),
                                             livetv::observability::BoolField("tracing", telemetry.tracing()),
                                             livetv::observability::BoolField("metrics", telemetry.metrics())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LIVETV_LOG_INFO("Shutting down tuner broker");

    server.Stop();
    StopWorkers(app);
  } catch (const std::exception& e) {
    LIVETV_LOG_ERROR("Fatal error", {livetv::observability::StringField("error", e.what())});
    livetv::observability::ShutdownLogging();
    return 2;
  }

  livetv::observability::ShutdownLogging();
  return 0;
}
