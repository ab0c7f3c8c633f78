#include <pthread.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

namespace {

using caretask::observability::BoolField;
using caretask::observability::IntField;
using caretask::observability::StringField;
using caretask::runtime::config::DatabaseConfig;
using caretask::runtime::config::RuntimeConfig;

constexpr const char* kUsage = "usage: caretask-server [--config] <config.yaml>";

std::optional<std::string> ConfigPathFromArgs(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) != "--config") return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  return std::nullopt;
}

const char* DatabaseBackendName(const DatabaseConfig& database) {
  switch (database.backend_case()) {
    case DatabaseConfig::kSqlite:
      return "sqlite";
    case DatabaseConfig::kPostgres:
      return "postgres";
    default:
      return "memory";
  }
}

// Logging first, so exporter setup can report itself. Everything is flushed
// on every exit path.
struct TelemetryScope {
  explicit TelemetryScope(const RuntimeConfig& config) {
    caretask::observability::InitializeLogging(config);
    tracing = caretask::observability::InitializeTracing(config);
    metrics = caretask::observability::InitializeMetrics(config);
  }

  ~TelemetryScope() {
    caretask::observability::ShutdownTracing();
    caretask::observability::ShutdownMetrics();
    caretask::observability::ShutdownLogging();
  }

  TelemetryScope(const TelemetryScope&)            = delete;
  TelemetryScope& operator=(const TelemetryScope&) = delete;

  bool tracing = false;
  bool metrics = false;
};

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPathFromArgs(argc, argv);
  if (!config_path) {
    std::cerr << kUsage << std::endl;
    return 1;
  }

  RuntimeConfig config;
  try {
    config = caretask::config::ConfigLoader::LoadFromYaml(*config_path);
  } catch (const std::exception& e) {
    std::cerr << "caretask-server: " << e.what() << std::endl;
    return 1;
  }

  // Stop signals are taken with sigwait below. The mask is set before any
  // gRPC thread exists so every thread inherits it.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  if (const int rc = pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr); rc != 0) {
    std::cerr << "caretask-server: cannot block stop signals: " << std::strerror(rc) << std::endl;
    return 1;
  }

  TelemetryScope telemetry(config);
  try {
    // hydrates the due cache from the store when scheduler.hydrate_on_start is set
    auto app = caretask::factory::Build(config, std::make_shared<caretask::util::SystemTimeSource>());

    caretask::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    CARETASK_LOG_INFO("caretask server ready",
                      {StringField("database", DatabaseBackendName(config.database())),
                       BoolField("hydrate_on_start", config.scheduler().hydrate_on_start()), BoolField("tracing", telemetry.tracing),
                       BoolField("metrics", telemetry.metrics)});

    int signal_number = 0;
    if (const int rc = sigwait(&stop_signals, &signal_number); rc != 0) {
      CARETASK_LOG_ERROR("waiting for stop signal failed", {StringField("error", std::strerror(rc))});
    } else {
      CARETASK_LOG_INFO("stop signal received; draining in-flight calls", {IntField("signal", signal_number)});
    }
    server.Stop();
  } catch (const std::exception& e) {
    CARETASK_LOG_ERROR("caretask server failed", {StringField("error", e.what())});
    return 2;
  }

  return 0;
}
