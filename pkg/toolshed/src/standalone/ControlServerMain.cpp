// Repository: Toolshed
// Component: Control Server
// Purpose: Hosts the CatalogControl gRPC service over one session.
// Copyright (c) 2025 Toolshed

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "control/CatalogControlService.h"
#include "toolshed/app/AppConfig.hpp"
#include "toolshed/app/SystemInfo.hpp"
#include "toolshed/catalog/CatalogCache.hpp"
#include "toolshed/catalog/ScriptDirectoryProvider.hpp"
#include "toolshed/execution/ExecutionCoordinator.hpp"
#include "toolshed/execution/ProcessCommandRunner.hpp"
#include "toolshed/util/Logger.hpp"

namespace {

using toolshed::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  toolshed::app::AppConfig config = toolshed::app::ParseArgs(argc, argv);

  if (config.help) {
    toolshed::app::PrintUsage(argv[0], std::cout);
    return 0;
  }

  if (!config.valid) {
    std::cerr << "Error: " << config.error << "\n\n";
    toolshed::app::PrintUsage(argv[0], std::cerr);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  toolshed::app::WarnIfRoot(config.bypass_root);

  auto provider =
      std::make_shared<toolshed::catalog::ScriptDirectoryProvider>(config.catalog_dir);
  auto cache = std::make_shared<toolshed::catalog::CatalogCache>(provider);
  auto coordinator = std::make_shared<toolshed::execution::ExecutionCoordinator>(
      std::make_shared<toolshed::execution::ProcessCommandRunner>());

  toolshed::control::CatalogControlImpl service(cache, coordinator, config.Validate());

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials(),
                           &bound_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    std::ostringstream oss;
    oss << "[ControlServer] LISTEN_FAILED address=" << config.listen_address;
    Logger::Error(oss.str());
    return 1;
  }

  {
    std::ostringstream oss;
    oss << "[ControlServer] LISTENING address=" << config.listen_address
        << " catalog=" << config.catalog_dir
        << " validate=" << (config.Validate() ? "true" : "false");
    Logger::Info(oss.str());
  }

  // Wait() would block signal handling; poll the flag instead.
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(config.tick_ms));
  }

  Logger::Info("[ControlServer] SHUTDOWN_REQUESTED");
  server->Shutdown();
  server->Wait();
  return 0;
}
