#include "http_server.hpp"

#include "sceneseek/chat_completions_backend.hpp"
#include "sceneseek/config.hpp"
#include "sceneseek/errors.hpp"
#include "sceneseek/generation.hpp"
#include "sceneseek/logging.hpp"
#include "sceneseek/rule_based_planner.hpp"
#include "sceneseek/service_runtime.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

sceneseek::server::HttpServer* g_server = nullptr;

void HandleSignal(int) {
  if (g_server != nullptr) {
    g_server->Stop();
  }
}

void PrintUsage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " [--config <file>]   # serve /chat and /conversations (SCENESEEK_PORT or 8000)\n";
}

std::unique_ptr<sceneseek::GenerationBackend> MakeBackend(const sceneseek::ServiceConfig& config) {
  if (config.planner.kind == sceneseek::PlannerKind::kChatCompletions) {
    return std::make_unique<sceneseek::ChatCompletionsBackend>(config.planner);
  }
  sceneseek::RuleBasedPlannerOptions options{};
  options.search_limit = config.tools.default_limit;
  return std::make_unique<sceneseek::RuleBasedPlanner>(options);
}

}  // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return EXIT_SUCCESS;
    } else {
      std::cerr << "error: unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  try {
    const auto config = sceneseek::ResolveConfig(config_path);
    sceneseek::ConfigureLogging(config.logging);
    sceneseek::ServiceRuntime runtime(config, MakeBackend(config));
    sceneseek::server::HttpServer server(runtime, config.server);
    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    const bool listened = server.Listen();
    g_server = nullptr;
    if (!listened) {
      spdlog::error("failed to bind {}:{}", config.server.host, config.server.port);
      return 2;
    }
    spdlog::info("server stopped");
    return EXIT_SUCCESS;
  } catch (const sceneseek::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    spdlog::error("fatal: {}", ex.what());
    return 2;
  }
}
