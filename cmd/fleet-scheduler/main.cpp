#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

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
    std::cerr << "Usage: fleet-scheduler <config.yaml> OR fleet-scheduler --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeMetrics(config);
    fleet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fleet::factory::Build(config);

    // Register signal handlers before starting the scheduler to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    fleet::factory::Start(app);
    FLEET_LOG_INFO("Fleet scheduler started", {fleet::observability::IntField("schedules", static_cast<int64_t>(app.scheduler->GetAllSchedules().size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEET_LOG_INFO("Shutting down fleet scheduler");

    fleet::factory::Stop(app);
    fleet::observability::ShutdownLogging();
    fleet::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
    fleet::observability::ShutdownLogging();
    fleet::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
