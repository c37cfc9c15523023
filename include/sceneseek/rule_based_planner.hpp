#pragma once

#include "sceneseek/generation.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sceneseek {

struct RuleBasedPlannerOptions {
  int search_limit = 10;
  std::size_t answer_items = 5;
};

// Deterministic offline backend. Routes the query by keyword heuristics,
// falls back to keyword search after a failed or empty round, and answers
// by listing the gathered files.
class RuleBasedPlanner final : public GenerationBackend {
 public:
  explicit RuleBasedPlanner(RuleBasedPlannerOptions options = {});

  Decision Decide(const DecisionRequest& request) override;
  void StreamAnswer(const AnswerRequest& request, const ChunkCallback& on_chunk) override;

  // First-round routing only; exposed for tests.
  [[nodiscard]] ToolCall Route(const std::string& query, bool has_image) const;

 private:
  RuleBasedPlannerOptions options_{};
};

// Splits text into word-sized chunks that concatenate back to the input.
std::vector<std::string> ChunkWords(std::string_view text);

}  // namespace sceneseek
