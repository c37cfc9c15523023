#include "sceneseek/config.hpp"
#include "sceneseek/errors.hpp"
#include "sceneseek/logging.hpp"

#include "../test_logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

namespace {

using sceneseek::Json;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename Fn>
void RequireConfigError(Fn&& fn, const std::string& message) {
  try {
    fn();
  } catch (const sceneseek::ConfigError&) {
    return;
  }
  throw std::runtime_error(message);
}

sceneseek::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    const auto it = values.find(std::string(name));
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

std::filesystem::path UniquePath(const std::string& stem) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(now) + ".json");
}

void ScenarioDefaultsAreValid() {
  sceneseek::tests::Log("scenario: defaults");
  const sceneseek::ServiceConfig config{};
  sceneseek::ValidateConfig(config);
  Require(config.agent.max_iterations == 5 && config.agent.history_turns == 10, "agent defaults");
  Require(config.tools.default_limit == 10 && config.tools.max_limit == 50, "tool limit defaults");
  Require(config.server.port == 8000 && !config.server.api_key.has_value(), "server defaults");
  Require(config.planner.kind == sceneseek::PlannerKind::kRules, "offline planner by default");
}

void ScenarioMergeJson() {
  sceneseek::tests::Log("scenario: merge json");
  sceneseek::ServiceConfig config{};
  sceneseek::MergeConfigJson(config,
                             Json{
                                 {"catalog_db", "/data/catalog.db"},
                                 {"agent", {{"max_iterations", 3}, {"tool_timeout_ms", 1500}, {"answer_grace_ms", 2500}}},
                                 {"tools", {{"default_result_limit", 5}}},
                                 {"planner", {{"kind", "chat_completions"}, {"temperature", 0}, {"api_key", "k"}}},
                                 {"server", {{"port", 9100}, {"api_key", ""}}},
                                 {"thumbnails", {{"base_url", "https://cdn.test"}}},
                                 {"logging", {{"level", "debug"}}},
                             });
  Require(config.catalog_db == "/data/catalog.db", "top-level string merged");
  Require(config.conversation_db == "sceneseek_conversations.db", "absent keys keep defaults");
  Require(config.agent.max_iterations == 3 && config.agent.tool_timeout == std::chrono::milliseconds(1500),
          "agent section merged");
  Require(config.agent.answer_grace == std::chrono::milliseconds(2500), "answer grace merged");
  Require(config.agent.loop_timeout == std::chrono::milliseconds(120000), "unmentioned agent keys kept");
  Require(config.tools.default_limit == 5 && config.tools.max_limit == 50, "tools section merged");
  Require(config.planner.kind == sceneseek::PlannerKind::kChatCompletions && config.planner.temperature == 0.0 &&
              config.planner.api_key == "k",
          "planner section merged");
  Require(config.server.port == 9100 && !config.server.api_key.has_value(), "empty api key disables auth");
  Require(config.thumbnail_base_url == "https://cdn.test" && config.logging.level == "debug", "other sections");
  sceneseek::ValidateConfig(config);

  RequireConfigError([&]() { sceneseek::MergeConfigJson(config, Json{{"agnet", Json::object()}}); },
                     "unknown root keys are rejected");
  RequireConfigError([&]() { sceneseek::MergeConfigJson(config, Json{{"agent", {{"retries", 2}}}}); },
                     "unknown section keys are rejected");
  RequireConfigError([&]() { sceneseek::MergeConfigJson(config, Json{{"agent", {{"max_iterations", "five"}}}}); },
                     "wrong types are rejected");
  RequireConfigError([&]() { sceneseek::MergeConfigJson(config, Json{{"agent", {{"history_turns", -1}}}}); },
                     "negative history is rejected");
  RequireConfigError([&]() { sceneseek::MergeConfigJson(config, Json{{"planner", {{"kind", "oracle"}}}}); },
                     "unknown planner kinds are rejected");
  RequireConfigError([&]() { sceneseek::MergeConfigJson(config, Json::array()); }, "root must be an object");
}

void ScenarioEnvironmentOverrides() {
  sceneseek::tests::Log("scenario: environment overrides");
  sceneseek::ServiceConfig config{};
  config.server.api_key = std::string("from-file");
  sceneseek::ApplyEnvironmentOverrides(config,
                                       FakeEnv({
                                           {"SCENESEEK_CATALOG_DB", "/env/catalog.db"},
                                           {"SCENESEEK_PORT", "8443"},
                                           {"SCENESEEK_API_KEY", ""},
                                           {"SCENESEEK_MAX_ITERATIONS", "7"},
                                           {"SCENESEEK_PLANNER", "chat_completions"},
                                           {"SCENESEEK_LLM_MODEL", "qwen"},
                                       }));
  Require(config.catalog_db == "/env/catalog.db" && config.server.port == 8443, "paths and port overridden");
  Require(!config.server.api_key.has_value(), "empty SCENESEEK_API_KEY clears the key");
  Require(config.agent.max_iterations == 7, "iterations overridden");
  Require(config.planner.kind == sceneseek::PlannerKind::kChatCompletions && config.planner.model == "qwen",
          "planner overridden");

  RequireConfigError([&]() { sceneseek::ApplyEnvironmentOverrides(config, FakeEnv({{"SCENESEEK_PORT", "80a"}})); },
                     "non-numeric port rejected");
  RequireConfigError([&]() { sceneseek::ApplyEnvironmentOverrides(config, FakeEnv({{"SCENESEEK_PORT", "70000"}})); },
                     "out of range port rejected");
  RequireConfigError([&]() { sceneseek::ApplyEnvironmentOverrides(config, FakeEnv({{"SCENESEEK_PLANNER", "x"}})); },
                     "unknown planner rejected");
}

void ScenarioValidation() {
  sceneseek::tests::Log("scenario: validation");
  auto expect_invalid = [](auto mutate, const std::string& message) {
    sceneseek::ServiceConfig config{};
    mutate(config);
    RequireConfigError([&]() { sceneseek::ValidateConfig(config); }, message);
  };
  expect_invalid([](sceneseek::ServiceConfig& c) { c.agent.max_iterations = 0; }, "zero iterations");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.agent.max_iterations = 101; }, "too many iterations");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.agent.tool_timeout = std::chrono::milliseconds(0); },
                 "zero tool timeout");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.agent.answer_grace = std::chrono::milliseconds(0); },
                 "zero answer grace");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.tools.default_limit = 60; }, "default above max");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.server.port = 0; }, "port zero");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.catalog_db.clear(); }, "empty catalog path");
  expect_invalid([](sceneseek::ServiceConfig& c) { c.logging.level = "loud"; }, "unknown log level");
}

void ScenarioResolveFromFile() {
  sceneseek::tests::Log("scenario: resolve from file");
  const auto path = UniquePath("sceneseek_config");
  {
    std::ofstream out(path);
    out << R"({"catalog_db": "/file/catalog.db", "server": {"port": 9000}})";
  }
  try {
    const auto via_argument = sceneseek::ResolveConfig(path.string(), FakeEnv({{"SCENESEEK_PORT", "9001"}}));
    Require(via_argument.catalog_db == "/file/catalog.db", "file values applied");
    Require(via_argument.server.port == 9001, "environment wins over the file");

    const auto via_env = sceneseek::ResolveConfig(std::nullopt, FakeEnv({{"SCENESEEK_CONFIG", path.string()}}));
    Require(via_env.server.port == 9000, "SCENESEEK_CONFIG names the file");

    const auto defaults = sceneseek::ResolveConfig(std::nullopt, FakeEnv({}));
    Require(defaults.catalog_db == "sceneseek_catalog.db", "no file means defaults");

    RequireConfigError([]() { sceneseek::ResolveConfig(std::string("/nonexistent/sceneseek.json"), FakeEnv({})); },
                       "missing config file is an error");
  } catch (...) {
    std::filesystem::remove(path);
    throw;
  }
  std::filesystem::remove(path);
}

void ScenarioLogging() {
  sceneseek::tests::Log("scenario: logging");
  Require(sceneseek::ParseLogLevel("WARNING") == spdlog::level::warn, "warning alias");
  Require(sceneseek::ParseLogLevel("err") == spdlog::level::err, "err alias");
  Require(!sceneseek::ParseLogLevel("verbose").has_value(), "unknown level");

  sceneseek::LoggingConfig logging{};
  logging.level = "debug";
  sceneseek::ConfigureLogging(logging);
  Require(spdlog::default_logger()->level() == spdlog::level::debug, "level applied to the default logger");
  sceneseek::ConfigureLogging(logging);
  Require(spdlog::get("sceneseek") != nullptr, "reconfiguring reuses the logger");

  logging.level = "loud";
  bool threw = false;
  try {
    sceneseek::ConfigureLogging(logging);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "unknown level rejected");
}

}  // namespace

int main() {
  try {
    sceneseek::tests::Log("config_test: start");
    ScenarioDefaultsAreValid();
    ScenarioMergeJson();
    ScenarioEnvironmentOverrides();
    ScenarioValidation();
    ScenarioResolveFromFile();
    ScenarioLogging();
    sceneseek::tests::Log("config_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sceneseek::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
