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

using reservation::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

void ShutdownObservability() {
  reservation::observability::ShutdownLogging();
  reservation::observability::ShutdownMetrics();
  reservation::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: reservation-engine <config.yaml> OR reservation-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = reservation::config::ConfigLoader::LoadFromYaml(config_path);

    reservation::observability::InitializeTracing(config);
    reservation::observability::InitializeMetrics(config);
    reservation::observability::InitializeLogging(config);

    auto app = reservation::factory::Build(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string(kDefaultBindAddress) : config.server().bind_address();
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RESERVATION_LOG_INFO("Reservation engine started", {reservation::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RESERVATION_LOG_INFO("Shutting down reservation engine");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RESERVATION_LOG_ERROR("Fatal error", {reservation::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
