#pragma once

#include "sceneseek/agent_loop.hpp"
#include "sceneseek/catalog_tools.hpp"
#include "sceneseek/embeddings.hpp"
#include "sceneseek/logging.hpp"
#include "sceneseek/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sceneseek {

enum class PlannerKind {
  kRules,
  kChatCompletions,
};

std::string_view PlannerKindName(PlannerKind kind);
std::optional<PlannerKind> ParsePlannerKind(std::string_view name);

struct PlannerConfig {
  PlannerKind kind = PlannerKind::kRules;
  std::string endpoint = "http://127.0.0.1:8080";
  std::string model = "local-model";
  double temperature = 0.2;
  std::chrono::milliseconds request_timeout{60000};
  std::optional<std::string> api_key;
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
  std::optional<std::string> api_key;
  std::string cors_origin = "*";
};

struct ServiceConfig {
  std::string catalog_db = "sceneseek_catalog.db";
  std::string conversation_db = "sceneseek_conversations.db";
  std::string thumbnail_base_url;
  int thumbnail_expiry_seconds = 3600;
  AgentConfig agent{};
  CatalogToolOptions tools{};
  EmbeddingLimits embedding{};
  PlannerConfig planner{};
  ServerConfig server{};
  LoggingConfig logging{};
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

// Reads std::getenv.
std::optional<std::string> ProcessEnvironment(std::string_view name);

// Overlays every key present in `overrides`; absent keys keep their value.
// Throws ConfigError on unknown sections or wrongly typed values.
void MergeConfigJson(ServiceConfig& config, const Json& overrides);
void LoadConfigFile(ServiceConfig& config, const std::string& path);
// SCENESEEK_* variables win over the file.
void ApplyEnvironmentOverrides(ServiceConfig& config, const EnvLookup& env);
void ValidateConfig(const ServiceConfig& config);

// Defaults, then the file from `config_path` or SCENESEEK_CONFIG, then the
// environment. The result is validated.
ServiceConfig ResolveConfig(const std::optional<std::string>& config_path, const EnvLookup& env = ProcessEnvironment);

}  // namespace sceneseek
