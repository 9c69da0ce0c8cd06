#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/upstream/upstream_check_worker.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

// rackwise [--check] [--config] <config.yaml>
std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      options.check_only = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) return std::nullopt;
      options.config_path = argv[++i];
    } else if (options.config_path.empty() && arg.rfind("--", 0) != 0) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) return std::nullopt;
  return options;
}

int Run(const rackwise::runtime::config::RuntimeConfig& config) {
  using rackwise::observability::StringField;

  auto app = rackwise::factory::Build(config);

  rackwise::runtime::Server server(config.server().bind_address(), std::chrono::milliseconds(config.server().shutdown_grace_ms()),
                                   std::move(app.grpc_services));

  std::signal(SIGINT, RequestStop);
  std::signal(SIGTERM, RequestStop);

  server.Start();
  if (app.upstream_worker) {
    app.upstream_worker->Start();
  }
  RACKWISE_LOG_INFO("rackwise started", {StringField("bind_address", config.server().bind_address()),
                                         rackwise::observability::BoolField("upstream_check", app.upstream_worker != nullptr)});

  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  RACKWISE_LOG_INFO("rackwise stopping");

  // Worker first: a pass in flight may still call the load balancer.
  if (app.upstream_worker) {
    app.upstream_worker->Stop();
  }
  server.Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    std::cerr << "Usage: rackwise [--check] [--config] <config.yaml>" << std::endl;
    return 1;
  }

  rackwise::runtime::config::RuntimeConfig config;
  try {
    config = rackwise::config::ConfigLoader::LoadFromYaml(options->config_path);
  } catch (const std::exception& e) {
    std::cerr << "rackwise: " << e.what() << std::endl;
    return 1;
  }
  if (options->check_only) {
    std::cout << options->config_path << ": ok" << std::endl;
    return 0;
  }

  int rc = 0;
  try {
    rackwise::observability::InitializeLogging(config.logging());
    rc = Run(config);
  } catch (const std::exception& e) {
    RACKWISE_LOG_ERROR("fatal error", {rackwise::observability::StringField("error", e.what())});
    rc = 2;
  }
  rackwise::observability::ShutdownLogging();
  return rc;
}
