#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>

namespace sceneseek {

struct LoggingConfig {
  std::string level = "info";
  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

// trace, debug, info, warn/warning, error/err, critical, off. Case-insensitive.
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

// Installs a stderr logger as the spdlog default so stdout stays free for
// event frames. Throws std::invalid_argument for an unknown level.
void ConfigureLogging(const LoggingConfig& config);

}  // namespace sceneseek
