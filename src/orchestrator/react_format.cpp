#include "sceneseek/react_format.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sceneseek {
namespace {

constexpr std::size_t kPromptHistoryTurns = 5;
constexpr std::size_t kSummaryItems = 5;

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

void AppendHistory(std::ostringstream& out, const std::vector<Turn>& history) {
  if (history.empty()) {
    return;
  }
  out << "Recent conversation:\n";
  const auto begin = history.size() > kPromptHistoryTurns ? history.size() - kPromptHistoryTurns : 0;
  for (std::size_t i = begin; i < history.size(); ++i) {
    const auto& turn = history[i];
    if (turn.kind == TurnKind::kToolCall) {
      continue;
    }
    out << (turn.kind == TurnKind::kUser ? "User: " : "Assistant: ") << turn.content << "\n";
  }
  out << "\n";
}

// Returns the balanced {...} object starting at the first brace, or the rest
// of the line when no brace is present.
std::string_view ExtractJsonObject(std::string_view text) {
  const auto open = text.find('{');
  if (open == std::string_view::npos) {
    const auto newline = text.find('\n');
    return TrimView(text.substr(0, newline));
  }
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    if (ch == '"') {
      in_string = true;
    } else if (ch == '{') {
      ++depth;
    } else if (ch == '}') {
      --depth;
      if (depth == 0) {
        return text.substr(open, i - open + 1);
      }
    }
  }
  return text.substr(open);
}

}  // namespace

std::string BuildToolCatalogText(const std::vector<const ToolDefinition*>& tools) {
  std::ostringstream out;
  for (const auto* tool : tools) {
    out << "- " << tool->signature << "\n  " << tool->description << "\n";
  }
  return out.str();
}

std::string SummarizeToolExchange(const ToolExchange& exchange, std::size_t max_items) {
  std::ostringstream out;
  out << exchange.call.name << " " << exchange.call.args.dump();
  if (!exchange.outcome.ok) {
    out << " failed ("
        << ToolFailureKindName(exchange.outcome.failure.value_or(ToolFailureKind::kExecutionError))
        << "): " << exchange.outcome.message;
    return out.str();
  }
  const auto& data = exchange.outcome.data;
  if (data.contains("results") && data["results"].is_array()) {
    const auto& results = data["results"];
    out << " returned " << results.size() << " results";
    const auto shown = std::min(results.size(), max_items);
    for (std::size_t i = 0; i < shown; ++i) {
      const auto& item = results[i];
      out << "\n    " << (i + 1) << ". [" << item.value("id", std::int64_t{0}) << "] " << item.value("name", std::string()) << " ("
          << item.value("path", std::string()) << ")";
      if (item.contains("score") && item["score"].is_number()) {
        out << " score=" << item["score"].get<double>();
      }
    }
    return out.str();
  }
  out << " returned " << data.dump();
  return out.str();
}

std::string BuildDecisionPrompt(const DecisionRequest& request) {
  std::ostringstream out;
  out << "You help artists find files in a production media catalog (Blender scenes, images, video, audio, "
         "code, documents).\n\n";
  out << "Available tools:\n" << BuildToolCatalogText(request.tools) << "\n";
  AppendHistory(out, request.history);
  out << "Question: " << request.query << "\n";
  if (request.has_image) {
    out << "The user attached an image; search_by_uploaded_image can use it.\n";
  }
  if (!request.tool_history.empty()) {
    out << "\nTool results so far:\n";
    for (const auto& exchange : request.tool_history) {
      out << "- " << SummarizeToolExchange(exchange, kSummaryItems) << "\n";
    }
  }
  out << "\nStep " << request.iteration << " of " << request.max_iterations << ".\n";
  out << "Respond in exactly this format:\n"
         "Thought: <reasoning>\n"
         "Action: <tool name>\n"
         "Action Input: <JSON object of arguments>\n"
         "(repeat Action and Action Input to call several tools at once)\n"
         "or, when the results are sufficient:\n"
         "Thought: <reasoning>\n"
         "Final Answer: <answer>\n";
  return out.str();
}

std::string BuildAnswerPrompt(const AnswerRequest& request) {
  std::ostringstream out;
  out << "Answer the user's question using only the catalog files listed below. Mention files by name.\n\n";
  AppendHistory(out, request.history);
  out << "Question: " << request.query << "\n\n";
  if (request.tool_history.empty()) {
    out << "No tool results are available.\n";
  } else {
    out << "Tool results:\n";
    for (const auto& exchange : request.tool_history) {
      out << "- " << SummarizeToolExchange(exchange, kSummaryItems * 2) << "\n";
    }
  }
  if (request.best_effort) {
    out << "\nThe search was cut short. Say that the answer is based on partial results.\n";
  }
  if (request.draft_answer.has_value() && !request.draft_answer->empty()) {
    out << "\nDraft answer: " << *request.draft_answer << "\n";
  }
  out << "\nAnswer:";
  return out.str();
}

Decision ParseReactResponse(std::string_view text) {
  Decision decision{};
  std::size_t cursor = 0;
  while (cursor < text.size()) {
    const auto line_end = text.find('\n', cursor);
    const auto line = TrimView(text.substr(cursor, line_end == std::string_view::npos ? std::string_view::npos
                                                                                      : line_end - cursor));
    const auto next = line_end == std::string_view::npos ? text.size() : line_end + 1;

    if (line.rfind("Thought:", 0) == 0 && decision.thought.empty()) {
      decision.thought = std::string(TrimView(line.substr(8)));
    } else if (line.rfind("Final Answer:", 0) == 0) {
      const auto offset = text.find("Final Answer:", cursor) + 13;
      decision.final_answer = std::string(TrimView(text.substr(offset)));
      break;
    } else if (line.rfind("Action:", 0) == 0) {
      ToolCall call{};
      call.name = std::string(TrimView(line.substr(7)));
      std::size_t after = next;
      const auto input_at = text.find("Action Input:", next);
      const auto next_action = text.find("Action:", next);
      if (input_at != std::string_view::npos && (next_action == std::string_view::npos || input_at < next_action)) {
        const auto raw = ExtractJsonObject(text.substr(input_at + 13));
        auto parsed = Json::parse(raw.begin(), raw.end(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
          call.args = {{"_raw_input", std::string(raw)}};
        } else {
          call.args = std::move(parsed);
        }
        after = static_cast<std::size_t>(raw.data() + raw.size() - text.data());
      }
      if (!call.name.empty()) {
        decision.tool_calls.push_back(std::move(call));
      }
      cursor = after;
      continue;
    }
    cursor = next;
  }

  if (decision.tool_calls.empty() && !decision.final_answer.has_value()) {
    const auto trimmed = TrimView(text);
    decision.final_answer = std::string(trimmed);
  }
  if (!decision.tool_calls.empty()) {
    decision.final_answer.reset();
  }
  return decision;
}

}  // namespace sceneseek
