#pragma once

#include "sceneseek/generation.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sceneseek {

// One line per tool: signature followed by its description.
std::string BuildToolCatalogText(const std::vector<const ToolDefinition*>& tools);

// One line per exchange: failure kind and message, or the top results.
std::string SummarizeToolExchange(const ToolExchange& exchange, std::size_t max_items);

// Thought/Action/Action Input/Final Answer protocol prompt.
std::string BuildDecisionPrompt(const DecisionRequest& request);
std::string BuildAnswerPrompt(const AnswerRequest& request);

// Every Action line paired with the JSON object that follows "Action Input:"
// becomes a tool call. Unparseable input is kept under "_raw_input" so schema
// validation reports it back. Text with neither actions nor a
// "Final Answer:" is treated as the final answer.
Decision ParseReactResponse(std::string_view text);

}  // namespace sceneseek
