#include "sceneseek/config.hpp"

#include "sceneseek/errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>

namespace sceneseek {
namespace {

const Json* Member(const Json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

void RequireObject(const Json& value, std::string_view where) {
  if (!value.is_object()) {
    throw ConfigError("config '" + std::string(where) + "' must be an object");
  }
}

void RejectUnknownKeys(const Json& object, std::string_view where, std::initializer_list<const char*> known) {
  for (auto it = object.begin(); it != object.end(); ++it) {
    bool found = false;
    for (const auto* key : known) {
      if (it.key() == key) {
        found = true;
        break;
      }
    }
    if (!found) {
      throw ConfigError("unknown config key: " + std::string(where) + "." + it.key());
    }
  }
}

void ReadString(const Json& object, const char* key, std::string& out) {
  if (const auto* value = Member(object, key)) {
    if (!value->is_string()) {
      throw ConfigError(std::string("config '") + key + "' must be a string");
    }
    out = value->get<std::string>();
  }
}

void ReadOptionalString(const Json& object, const char* key, std::optional<std::string>& out) {
  if (const auto* value = Member(object, key)) {
    if (!value->is_string()) {
      throw ConfigError(std::string("config '") + key + "' must be a string");
    }
    auto text = value->get<std::string>();
    if (text.empty()) {
      out.reset();
    } else {
      out = std::move(text);
    }
  }
}

std::optional<std::int64_t> ReadInteger(const Json& object, const char* key) {
  const auto* value = Member(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_number_integer()) {
    throw ConfigError(std::string("config '") + key + "' must be an integer");
  }
  return value->get<std::int64_t>();
}

void ReadInt(const Json& object, const char* key, int& out) {
  if (const auto value = ReadInteger(object, key)) {
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
      throw ConfigError(std::string("config '") + key + "' is out of range");
    }
    out = static_cast<int>(*value);
  }
}

void ReadCount(const Json& object, const char* key, std::size_t& out) {
  if (const auto value = ReadInteger(object, key)) {
    if (*value < 0) {
      throw ConfigError(std::string("config '") + key + "' must not be negative");
    }
    out = static_cast<std::size_t>(*value);
  }
}

void ReadMillis(const Json& object, const char* key, std::chrono::milliseconds& out) {
  if (const auto value = ReadInteger(object, key)) {
    out = std::chrono::milliseconds(*value);
  }
}

std::int64_t ParseEnvInteger(std::string_view name, const std::string& text) {
  std::size_t consumed = 0;
  std::int64_t value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw ConfigError(std::string(name) + " must be an integer, got '" + text + "'");
  }
  if (consumed != text.size()) {
    throw ConfigError(std::string(name) + " must be an integer, got '" + text + "'");
  }
  return value;
}

void MergeAgent(AgentConfig& agent, const Json& section) {
  RequireObject(section, "agent");
  RejectUnknownKeys(section, "agent",
                    {"max_iterations", "history_turns", "tool_timeout_ms", "loop_timeout_ms", "answer_grace_ms",
                     "max_thumbnails_per_result", "results_in_event"});
  ReadInt(section, "max_iterations", agent.max_iterations);
  if (const auto turns = ReadInteger(section, "history_turns")) {
    if (*turns < 0) {
      throw ConfigError("history_turns must not be negative");
    }
    agent.history_turns = static_cast<std::size_t>(*turns);
  }
  ReadMillis(section, "tool_timeout_ms", agent.tool_timeout);
  ReadMillis(section, "loop_timeout_ms", agent.loop_timeout);
  ReadMillis(section, "answer_grace_ms", agent.answer_grace);
  ReadCount(section, "max_thumbnails_per_result", agent.max_thumbnails_per_result);
  ReadCount(section, "results_in_event", agent.results_in_event);
}

void MergePlanner(PlannerConfig& planner, const Json& section) {
  RequireObject(section, "planner");
  RejectUnknownKeys(section, "planner", {"kind", "endpoint", "model", "temperature", "timeout_ms", "api_key"});
  if (const auto* kind = Member(section, "kind")) {
    if (!kind->is_string()) {
      throw ConfigError("config 'kind' must be a string");
    }
    const auto parsed = ParsePlannerKind(kind->get<std::string>());
    if (!parsed.has_value()) {
      throw ConfigError("unknown planner kind: " + kind->get<std::string>());
    }
    planner.kind = *parsed;
  }
  ReadString(section, "endpoint", planner.endpoint);
  ReadString(section, "model", planner.model);
  if (const auto* temperature = Member(section, "temperature")) {
    if (!temperature->is_number()) {
      throw ConfigError("config 'temperature' must be a number");
    }
    planner.temperature = temperature->get<double>();
  }
  ReadMillis(section, "timeout_ms", planner.request_timeout);
  ReadOptionalString(section, "api_key", planner.api_key);
}

}  // namespace

std::string_view PlannerKindName(PlannerKind kind) {
  switch (kind) {
    case PlannerKind::kRules:
      return "rules";
    case PlannerKind::kChatCompletions:
      return "chat_completions";
  }
  return "rules";
}

std::optional<PlannerKind> ParsePlannerKind(std::string_view name) {
  if (name == "rules") {
    return PlannerKind::kRules;
  }
  if (name == "chat_completions") {
    return PlannerKind::kChatCompletions;
  }
  return std::nullopt;
}

std::optional<std::string> ProcessEnvironment(std::string_view name) {
  const std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

void MergeConfigJson(ServiceConfig& config, const Json& overrides) {
  RequireObject(overrides, "(root)");
  RejectUnknownKeys(overrides, "(root)",
                    {"catalog_db", "conversation_db", "thumbnails", "agent", "tools", "embedding", "planner",
                     "server", "logging"});
  ReadString(overrides, "catalog_db", config.catalog_db);
  ReadString(overrides, "conversation_db", config.conversation_db);

  if (const auto* thumbnails = Member(overrides, "thumbnails")) {
    RequireObject(*thumbnails, "thumbnails");
    RejectUnknownKeys(*thumbnails, "thumbnails", {"base_url", "expiry_seconds"});
    ReadString(*thumbnails, "base_url", config.thumbnail_base_url);
    ReadInt(*thumbnails, "expiry_seconds", config.thumbnail_expiry_seconds);
  }
  if (const auto* agent = Member(overrides, "agent")) {
    MergeAgent(config.agent, *agent);
  }
  if (const auto* tools = Member(overrides, "tools")) {
    RequireObject(*tools, "tools");
    RejectUnknownKeys(*tools, "tools", {"default_result_limit", "max_result_limit"});
    ReadInt(*tools, "default_result_limit", config.tools.default_limit);
    ReadInt(*tools, "max_result_limit", config.tools.max_limit);
  }
  if (const auto* embedding = Member(overrides, "embedding")) {
    RequireObject(*embedding, "embedding");
    RejectUnknownKeys(*embedding, "embedding", {"max_text_bytes", "max_image_bytes"});
    ReadCount(*embedding, "max_text_bytes", config.embedding.max_text_bytes);
    ReadCount(*embedding, "max_image_bytes", config.embedding.max_image_bytes);
  }
  if (const auto* planner = Member(overrides, "planner")) {
    MergePlanner(config.planner, *planner);
  }
  if (const auto* server = Member(overrides, "server")) {
    RequireObject(*server, "server");
    RejectUnknownKeys(*server, "server", {"host", "port", "api_key", "cors_origin"});
    ReadString(*server, "host", config.server.host);
    ReadInt(*server, "port", config.server.port);
    ReadOptionalString(*server, "api_key", config.server.api_key);
    ReadString(*server, "cors_origin", config.server.cors_origin);
  }
  if (const auto* logging = Member(overrides, "logging")) {
    RequireObject(*logging, "logging");
    RejectUnknownKeys(*logging, "logging", {"level", "pattern"});
    ReadString(*logging, "level", config.logging.level);
    ReadString(*logging, "pattern", config.logging.pattern);
  }
}

void LoadConfigFile(ServiceConfig& config, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("failed to open config file: " + path);
  }
  auto document = Json::parse(in, nullptr, false);
  if (document.is_discarded()) {
    throw ConfigError("config file is not valid JSON: " + path);
  }
  MergeConfigJson(config, document);
}

void ApplyEnvironmentOverrides(ServiceConfig& config, const EnvLookup& env) {
  if (auto value = env("SCENESEEK_CATALOG_DB")) {
    config.catalog_db = *value;
  }
  if (auto value = env("SCENESEEK_CONVERSATION_DB")) {
    config.conversation_db = *value;
  }
  if (auto value = env("SCENESEEK_PORT")) {
    const auto port = ParseEnvInteger("SCENESEEK_PORT", *value);
    if (port < 1 || port > 65535) {
      throw ConfigError("SCENESEEK_PORT must be in [1, 65535]");
    }
    config.server.port = static_cast<int>(port);
  }
  if (auto value = env("SCENESEEK_API_KEY")) {
    config.server.api_key = value->empty() ? std::nullopt : std::optional<std::string>(*value);
  }
  if (auto value = env("SCENESEEK_LOG_LEVEL")) {
    config.logging.level = *value;
  }
  if (auto value = env("SCENESEEK_MAX_ITERATIONS")) {
    const auto iterations = ParseEnvInteger("SCENESEEK_MAX_ITERATIONS", *value);
    if (iterations < std::numeric_limits<int>::min() || iterations > std::numeric_limits<int>::max()) {
      throw ConfigError("SCENESEEK_MAX_ITERATIONS is out of range");
    }
    config.agent.max_iterations = static_cast<int>(iterations);
  }
  if (auto value = env("SCENESEEK_THUMBNAIL_BASE_URL")) {
    config.thumbnail_base_url = *value;
  }
  if (auto value = env("SCENESEEK_PLANNER")) {
    const auto kind = ParsePlannerKind(*value);
    if (!kind.has_value()) {
      throw ConfigError("unknown SCENESEEK_PLANNER: " + *value);
    }
    config.planner.kind = *kind;
  }
  if (auto value = env("SCENESEEK_LLM_ENDPOINT")) {
    config.planner.endpoint = *value;
  }
  if (auto value = env("SCENESEEK_LLM_MODEL")) {
    config.planner.model = *value;
  }
}

void ValidateConfig(const ServiceConfig& config) {
  if (config.agent.max_iterations < 1 || config.agent.max_iterations > 100) {
    throw ConfigError("max_iterations must be in [1, 100]");
  }
  if (config.agent.tool_timeout.count() <= 0) {
    throw ConfigError("tool_timeout_ms must be positive");
  }
  if (config.agent.loop_timeout.count() <= 0) {
    throw ConfigError("loop_timeout_ms must be positive");
  }
  if (config.agent.answer_grace.count() <= 0) {
    throw ConfigError("answer_grace_ms must be positive");
  }
  if (config.tools.max_limit < 1) {
    throw ConfigError("max_result_limit must be at least 1");
  }
  if (config.tools.default_limit < 1 || config.tools.default_limit > config.tools.max_limit) {
    throw ConfigError("default_result_limit must be in [1, max_result_limit]");
  }
  if (config.embedding.max_text_bytes == 0 || config.embedding.max_image_bytes == 0) {
    throw ConfigError("embedding input limits must be positive");
  }
  if (config.server.port < 1 || config.server.port > 65535) {
    throw ConfigError("server port must be in [1, 65535]");
  }
  if (config.planner.request_timeout.count() <= 0) {
    throw ConfigError("planner timeout_ms must be positive");
  }
  if (config.thumbnail_expiry_seconds < 0) {
    throw ConfigError("thumbnail expiry must not be negative");
  }
  if (config.catalog_db.empty() || config.conversation_db.empty()) {
    throw ConfigError("database paths must not be empty");
  }
  if (!ParseLogLevel(config.logging.level).has_value()) {
    throw ConfigError("unknown log level: " + config.logging.level);
  }
}

ServiceConfig ResolveConfig(const std::optional<std::string>& config_path, const EnvLookup& env) {
  ServiceConfig config{};
  auto path = config_path;
  if (!path.has_value()) {
    path = env("SCENESEEK_CONFIG");
  }
  if (path.has_value() && !path->empty()) {
    LoadConfigFile(config, *path);
    spdlog::debug("loaded config file {}", *path);
  }
  ApplyEnvironmentOverrides(config, env);
  ValidateConfig(config);
  return config;
}

}  // namespace sceneseek
