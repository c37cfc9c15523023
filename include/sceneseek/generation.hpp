#pragma once

#include "sceneseek/tool_registry.hpp"
#include "sceneseek/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sceneseek {

// One executed tool call as fed back into the next decision.
struct ToolExchange {
  ToolCall call;
  ToolOutcome outcome;
  int iteration = 0;
};

struct DecisionRequest {
  std::string query;
  bool has_image = false;
  std::vector<Turn> history;
  std::vector<ToolExchange> tool_history;
  int iteration = 1;
  int max_iterations = 5;
  std::vector<const ToolDefinition*> tools;
};

// Either tool calls or a final answer. An empty decision also ends deciding.
struct Decision {
  std::string thought;
  std::vector<ToolCall> tool_calls;
  std::optional<std::string> final_answer;
};

struct AnswerRequest {
  std::string query;
  std::vector<Turn> history;
  std::vector<ToolExchange> tool_history;
  bool best_effort = false;
  std::optional<std::string> draft_answer;
};

// Returns false to stop streaming early.
using ChunkCallback = std::function<bool(std::string_view chunk)>;

// The text-generation side of the loop. Both calls may throw
// GenerationBackendUnavailable.
class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;
  virtual Decision Decide(const DecisionRequest& request) = 0;
  virtual void StreamAnswer(const AnswerRequest& request, const ChunkCallback& on_chunk) = 0;
};

}  // namespace sceneseek
