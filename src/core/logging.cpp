#include "sceneseek/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>

namespace sceneseek {

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
  std::string value;
  value.reserve(name.size());
  for (const char ch : name) {
    value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  if (value == "trace") {
    return spdlog::level::trace;
  }
  if (value == "debug") {
    return spdlog::level::debug;
  }
  if (value == "info") {
    return spdlog::level::info;
  }
  if (value == "warn" || value == "warning") {
    return spdlog::level::warn;
  }
  if (value == "error" || value == "err") {
    return spdlog::level::err;
  }
  if (value == "critical") {
    return spdlog::level::critical;
  }
  if (value == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

void ConfigureLogging(const LoggingConfig& config) {
  const auto level = ParseLogLevel(config.level);
  if (!level.has_value()) {
    throw std::invalid_argument("unknown log level: " + config.level);
  }
  auto logger = spdlog::get("sceneseek");
  if (logger == nullptr) {
    logger = spdlog::stderr_color_mt("sceneseek");
  }
  spdlog::set_default_logger(logger);
  logger->set_level(*level);
  if (!config.pattern.empty()) {
    logger->set_pattern(config.pattern);
  }
}

}  // namespace sceneseek
