#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/check/verdict.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using semconv::observability::IntField;
using semconv::observability::StringField;
using semconv::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  semconv::observability::ShutdownLogging();
  semconv::observability::ShutdownMetrics();
  semconv::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: semconv-checker <config.yaml> OR semconv-checker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = semconv::config::ConfigLoader::LoadFromYaml(config_path);
    semconv::config::ValidateConfig(config);

    semconv::observability::InitializeTracing(config);
    semconv::observability::InitializeMetrics(config);
    semconv::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (catalog, match table, services)
    // ------------------------------------------------------------
    auto app      = semconv::factory::Build(config);
    auto one_shot = app.one_shot;

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SEMCONV_LOG_INFO("semconv checker started",
                     {StringField("bind_address", config.server().bind_address()),
                      semconv::observability::BoolField("one_shot", config.one_shot())});

    // one-shot runs interrupted before any call never count as clean
    int exit_code = one_shot ? 2 : semconv::check::kExitClean;
    while (g_running) {
      if (!one_shot) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        continue;
      }
      if (auto verdict = one_shot->WaitFor(std::chrono::seconds(1))) {
        exit_code = semconv::check::ExitCode(*verdict);
        SEMCONV_LOG_INFO("one-shot check complete",
                         {IntField("violations", verdict->violation_count), IntField("exit_code", exit_code)});
        break;
      }
    }

    SEMCONV_LOG_INFO("Shutting down semconv checker");

    server.Stop();
    ShutdownObservability();
    return exit_code;
  } catch (const std::exception& e) {
    SEMCONV_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }
}
