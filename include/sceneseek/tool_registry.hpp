#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sceneseek {

enum class ToolFailureKind {
  kInvalidArgs,
  kExecutionError,
  kNotFound,
};

std::string_view ToolFailureKindName(ToolFailureKind kind);

enum class ToolOutputShape {
  kFileList,
  kStatistics,
  kFileDetails,
};

std::string_view ToolOutputShapeName(ToolOutputShape shape);

// Per-invocation inputs that do not travel through the argument mapping.
struct ToolContext {
  std::shared_ptr<const std::vector<std::uint8_t>> uploaded_image;
};

struct ToolOutcome {
  bool ok = false;
  Json data;
  std::optional<ToolFailureKind> failure;
  std::string message;

  static ToolOutcome Success(Json data);
  static ToolOutcome Failure(ToolFailureKind kind, std::string message);

  // {ok, data} or {ok, error_kind, message}.
  [[nodiscard]] Json ToJson() const;
  // Number of result records carried by a successful file-list outcome.
  [[nodiscard]] std::size_t result_count() const;
};

using ToolHandler = std::function<Json(const Json& args, const ToolContext& context)>;

struct ToolDefinition {
  std::string name;
  std::string description;
  std::string signature;
  Json input_schema = Json::object();
  ToolOutputShape output_shape = ToolOutputShape::kFileList;
  ToolHandler execute;
};

// Validates `args` against the subset of JSON Schema the tools declare:
// object properties with type, minimum, maximum and enum, plus required.
// Unknown properties are rejected. Returns the first violation.
std::optional<std::string> ValidateArgs(const Json& schema, const Json& args);

// Copies declared defaults into absent properties.
Json ApplyDefaults(const Json& schema, Json args);

// Name -> tool mapping. The loop only sees this interface, so adding a tool
// never touches the loop.
class ToolRegistry {
 public:
  void Register(ToolDefinition definition);

  [[nodiscard]] bool Contains(std::string_view name) const;
  [[nodiscard]] const ToolDefinition* Find(std::string_view name) const;
  [[nodiscard]] std::vector<const ToolDefinition*> List() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

  // Never throws for tool-level problems: invalid arguments are rejected
  // before the handler runs, handler exceptions become kExecutionError and
  // NotFoundError becomes kNotFound.
  ToolOutcome Invoke(const std::string& name, const Json& args, const ToolContext& context) const;

 private:
  std::vector<std::unique_ptr<ToolDefinition>> tools_{};
  std::unordered_map<std::string, const ToolDefinition*> by_name_{};
};

}  // namespace sceneseek
