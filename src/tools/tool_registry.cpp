#include "sceneseek/tool_registry.hpp"

#include "sceneseek/errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace sceneseek {
namespace {

bool MatchesType(const Json& value, const std::string& type) {
  if (type == "string") {
    return value.is_string();
  }
  if (type == "integer") {
    if (value.is_number_unsigned()) {
      return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    if (value.is_number_integer()) {
      return true;
    }
    if (value.is_number_float()) {
      // Integral and inside int64, so get<std::int64_t>() is exact.
      constexpr double kInt64Bound = 9223372036854775808.0;
      const double d = value.get<double>();
      return std::isfinite(d) && std::floor(d) == d && d >= -kInt64Bound && d < kInt64Bound;
    }
    return false;
  }
  if (type == "number") {
    return value.is_number();
  }
  if (type == "boolean") {
    return value.is_boolean();
  }
  if (type == "array") {
    return value.is_array();
  }
  if (type == "object") {
    return value.is_object();
  }
  return true;
}

std::optional<std::string> ValidateProperty(const std::string& key, const Json& schema, const Json& value) {
  if (schema.contains("type") && !MatchesType(value, schema["type"].get<std::string>())) {
    return "argument '" + key + "' must be of type " + schema["type"].get<std::string>();
  }
  if (schema.contains("enum")) {
    bool found = false;
    for (const auto& allowed : schema["enum"]) {
      if (allowed == value) {
        found = true;
        break;
      }
    }
    if (!found) {
      return "argument '" + key + "' must be one of " + schema["enum"].dump();
    }
  }
  if (value.is_number()) {
    const double number = value.get<double>();
    if (schema.contains("minimum") && number < schema["minimum"].get<double>()) {
      return "argument '" + key + "' must be >= " + schema["minimum"].dump();
    }
    if (schema.contains("maximum") && number > schema["maximum"].get<double>()) {
      return "argument '" + key + "' must be <= " + schema["maximum"].dump();
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view ToolFailureKindName(ToolFailureKind kind) {
  switch (kind) {
    case ToolFailureKind::kInvalidArgs:
      return "invalid_args";
    case ToolFailureKind::kExecutionError:
      return "execution_error";
    case ToolFailureKind::kNotFound:
      return "not_found";
  }
  return "execution_error";
}

std::string_view ToolOutputShapeName(ToolOutputShape shape) {
  switch (shape) {
    case ToolOutputShape::kFileList:
      return "file_list";
    case ToolOutputShape::kStatistics:
      return "statistics";
    case ToolOutputShape::kFileDetails:
      return "file_details";
  }
  return "file_list";
}

ToolOutcome ToolOutcome::Success(Json data) {
  ToolOutcome outcome{};
  outcome.ok = true;
  outcome.data = std::move(data);
  return outcome;
}

ToolOutcome ToolOutcome::Failure(ToolFailureKind kind, std::string message) {
  ToolOutcome outcome{};
  outcome.ok = false;
  outcome.failure = kind;
  outcome.message = std::move(message);
  return outcome;
}

Json ToolOutcome::ToJson() const {
  if (ok) {
    return {{"ok", true}, {"data", data}};
  }
  return {
      {"ok", false},
      {"error_kind", std::string(ToolFailureKindName(failure.value_or(ToolFailureKind::kExecutionError)))},
      {"message", message},
  };
}

std::size_t ToolOutcome::result_count() const {
  if (!ok) {
    return 0;
  }
  if (data.is_object() && data.contains("results") && data["results"].is_array()) {
    return data["results"].size();
  }
  return 1;
}

std::optional<std::string> ValidateArgs(const Json& schema, const Json& args) {
  if (!args.is_object()) {
    return std::string("arguments must be an object");
  }
  const Json properties = schema.value("properties", Json::object());
  for (const auto& [key, value] : args.items()) {
    if (!properties.contains(key)) {
      return "unknown argument '" + key + "'";
    }
    if (auto error = ValidateProperty(key, properties[key], value)) {
      return error;
    }
  }
  if (schema.contains("required")) {
    for (const auto& required : schema["required"]) {
      const auto key = required.get<std::string>();
      if (!args.contains(key) || args[key].is_null()) {
        return "missing required argument '" + key + "'";
      }
    }
  }
  return std::nullopt;
}

Json ApplyDefaults(const Json& schema, Json args) {
  if (!schema.contains("properties")) {
    return args;
  }
  for (const auto& [key, property] : schema["properties"].items()) {
    if (property.contains("default") && (!args.contains(key) || args[key].is_null())) {
      args[key] = property["default"];
    }
  }
  return args;
}

void ToolRegistry::Register(ToolDefinition definition) {
  if (definition.name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!definition.execute) {
    throw std::invalid_argument("tool '" + definition.name + "' has no handler");
  }
  if (by_name_.count(definition.name) != 0) {
    throw std::invalid_argument("tool already registered: " + definition.name);
  }
  auto owned = std::make_unique<ToolDefinition>(std::move(definition));
  by_name_.emplace(owned->name, owned.get());
  tools_.push_back(std::move(owned));
}

bool ToolRegistry::Contains(std::string_view name) const {
  return Find(name) != nullptr;
}

const ToolDefinition* ToolRegistry::Find(std::string_view name) const {
  const auto it = by_name_.find(std::string(name));
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<const ToolDefinition*> ToolRegistry::List() const {
  std::vector<const ToolDefinition*> out{};
  out.reserve(tools_.size());
  for (const auto& tool : tools_) {
    out.push_back(tool.get());
  }
  return out;
}

ToolOutcome ToolRegistry::Invoke(const std::string& name, const Json& args, const ToolContext& context) const {
  const auto* tool = Find(name);
  if (tool == nullptr) {
    return ToolOutcome::Failure(ToolFailureKind::kNotFound, "unknown tool '" + name + "'");
  }
  const Json normalized = args.is_null() ? Json::object() : args;
  if (auto violation = ValidateArgs(tool->input_schema, normalized)) {
    spdlog::warn("tool {} rejected arguments: {}", name, *violation);
    return ToolOutcome::Failure(ToolFailureKind::kInvalidArgs, *violation);
  }
  try {
    return ToolOutcome::Success(tool->execute(ApplyDefaults(tool->input_schema, normalized), context));
  } catch (const NotFoundError& e) {
    return ToolOutcome::Failure(ToolFailureKind::kNotFound, e.what());
  } catch (const std::exception& e) {
    spdlog::warn("tool {} failed: {}", name, e.what());
    return ToolOutcome::Failure(ToolFailureKind::kExecutionError, e.what());
  }
}

}  // namespace sceneseek
