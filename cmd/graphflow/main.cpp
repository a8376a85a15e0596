#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

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
    std::cerr << "Usage: graphflow <config.yaml> OR graphflow --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = graphflow::config::ConfigLoader::LoadFromYaml(config_path);

    graphflow::observability::InitializeTracing(config);
    graphflow::observability::InitializeMetrics(config);
    graphflow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = graphflow::factory::BuildRuntime(config);

    // Register signal handlers before starting background work.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime.maintenance->Start();
    GRAPHFLOW_LOG_INFO("graphflow started", {graphflow::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    GRAPHFLOW_LOG_INFO("shutting down graphflow",
                       {graphflow::observability::IntField("active_executions", static_cast<int64_t>(runtime.engine->ActiveExecutions()))});

    runtime.Shutdown();
    graphflow::observability::ShutdownLogging();
    graphflow::observability::ShutdownMetrics();
    graphflow::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    GRAPHFLOW_LOG_ERROR("Fatal error", {graphflow::observability::StringField("error", e.what())});
    graphflow::observability::ShutdownLogging();
    graphflow::observability::ShutdownMetrics();
    graphflow::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
