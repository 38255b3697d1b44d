#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
  g_stop_requested = 1;
}

struct CommandLine {
  std::string                  config_path;
  bool                         check_config = false;
  std::optional<std::uint32_t> workers;
  bool                         no_recover = false;
};

void Usage() {
  std::cerr << "Usage: batch-engine [--check-config] [--workers N] [--no-recover] <config.yaml>\n"
            << "       batch-engine --config <config.yaml> [...]\n"
            << "\n"
            << "  --check-config  print the effective configuration as JSON and exit\n"
            << "  --workers N     override engine.max_workers\n"
            << "  --no-recover    start without reloading unfinished jobs\n";
}

std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      cli.check_config = true;
    } else if (arg == "--no-recover") {
      cli.no_recover = true;
    } else if (arg == "--workers" && i + 1 < argc) {
      char*      end   = nullptr;
      const auto value = std::strtoul(argv[++i], &end, 10);
      if (end == nullptr || *end != '\0') return std::nullopt;
      cli.workers = static_cast<std::uint32_t>(value);
    } else if (arg == "--config" && i + 1 < argc) {
      cli.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && cli.config_path.empty()) {
      cli.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (cli.config_path.empty()) return std::nullopt;
  return cli;
}

void ApplyOverrides(const CommandLine& cli, batch::runtime::config::RuntimeConfig& config) {
  if (cli.workers) {
    config.mutable_engine()->set_max_workers(*cli.workers);
  }
  if (cli.no_recover) {
    config.mutable_engine()->set_recover_on_start(false);
  }
}

int PrintConfig(const batch::runtime::config::RuntimeConfig& config) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(config, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render config: " << status.message() << "\n";
    return 1;
  }
  std::cout << json << "\n";
  return 0;
}

void ShutdownObservability() {
  batch::observability::ShutdownMetrics();
  batch::observability::ShutdownTracing();
  batch::observability::ShutdownLogging();
}

int Run(const batch::runtime::config::RuntimeConfig& config) {
  auto app = batch::factory::Build(config);

  // recovery happens here, before clients can reach the port
  app.engine->Start();

  batch::runtime::ServerOptions server_options;
  server_options.bind_address      = config.server().bind_address();
  server_options.max_message_bytes = static_cast<int>(config.server().max_message_bytes());
  server_options.shutdown_grace    = std::chrono::milliseconds(config.server().shutdown_grace_ms());
  batch::runtime::Server server(server_options, std::move(app.grpc_services));

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  server.Start();
  BATCH_LOG_INFO("Batch engine started", {batch::observability::IntField("port", server.SelectedPort()),
                                          batch::observability::IntField("workers", static_cast<std::int64_t>(app.engine->WorkerCount()))});

  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  BATCH_LOG_INFO("Shutdown requested");
  // stop taking RPCs first so nothing new is submitted while workers drain
  server.Stop();
  app.engine->Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  auto cli = ParseCommandLine(argc, argv);
  if (!cli) {
    Usage();
    return 1;
  }

  batch::runtime::config::RuntimeConfig config;
  try {
    config = batch::config::ConfigLoader::LoadFromYaml(cli->config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  ApplyOverrides(*cli, config);

  if (cli->check_config) {
    return PrintConfig(config);
  }

  batch::observability::InitializeLogging(config);
  batch::observability::InitializeTracing(config);
  batch::observability::InitializeMetrics(config);

  int rc = 0;
  try {
    rc = Run(config);
  } catch (const std::exception& e) {
    BATCH_LOG_ERROR("Fatal error", {batch::observability::StringField("error", e.what())});
    rc = 2;
  }

  ShutdownObservability();
  return rc;
}
