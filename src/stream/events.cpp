#include "sceneseek/events.hpp"

#include <array>
#include <utility>

namespace sceneseek {
namespace {

struct EventTypeEntry {
  EventType type;
  std::string_view name;
};

constexpr std::array<EventTypeEntry, 10> kEventTypes = {{
    {EventType::kAgentStart, "agent_start"},
    {EventType::kToolCall, "tool_call"},
    {EventType::kToolResult, "tool_result"},
    {EventType::kThumbnail, "thumbnail"},
    {EventType::kAnswerStart, "answer_start"},
    {EventType::kAnswerChunk, "answer_chunk"},
    {EventType::kAnswerEnd, "answer_end"},
    {EventType::kDone, "done"},
    {EventType::kError, "error"},
    {EventType::kCancelled, "cancelled"},
}};

}  // namespace

std::string_view EventTypeName(EventType type) {
  for (const auto& entry : kEventTypes) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "error";
}

std::optional<EventType> ParseEventType(std::string_view name) {
  for (const auto& entry : kEventTypes) {
    if (entry.name == name) {
      return entry.type;
    }
  }
  return std::nullopt;
}

bool IsTerminal(EventType type) {
  return type == EventType::kDone || type == EventType::kError || type == EventType::kCancelled;
}

StreamEvent AgentStartEvent(const std::string& conversation_id, int max_iterations) {
  return {EventType::kAgentStart, {{"conversation_id", conversation_id}, {"max_iterations", max_iterations}}};
}

StreamEvent ToolCallEvent(const std::string& tool, const Json& args) {
  return {EventType::kToolCall, {{"tool", tool}, {"args", args}}};
}

StreamEvent ToolResultEvent(const std::string& tool, std::size_t count, Json results) {
  return {EventType::kToolResult, {{"tool", tool}, {"ok", true}, {"count", count}, {"results", std::move(results)}}};
}

StreamEvent ToolFailureEvent(const std::string& tool, std::string_view error_kind, const std::string& message) {
  return {EventType::kToolResult,
          {{"tool", tool},
           {"ok", false},
           {"count", 0},
           {"results", Json::array()},
           {"error_kind", std::string(error_kind)},
           {"error", message}}};
}

StreamEvent ThumbnailEvent(std::int64_t file_id, const std::string& file_name, const std::string& thumbnail_url) {
  return {EventType::kThumbnail,
          {{"file_id", file_id}, {"file_name", file_name}, {"thumbnail_url", thumbnail_url}}};
}

StreamEvent AnswerStartEvent() {
  return {EventType::kAnswerStart, Json::object()};
}

StreamEvent AnswerChunkEvent(std::string text) {
  return {EventType::kAnswerChunk, {{"text", std::move(text)}}};
}

StreamEvent AnswerEndEvent(bool best_effort) {
  return {EventType::kAnswerEnd, {{"best_effort", best_effort}}};
}

StreamEvent DoneEvent(const std::string& conversation_id,
                      std::size_t message_count,
                      bool best_effort,
                      std::string_view stop_reason) {
  return {EventType::kDone,
          {{"conversation_id", conversation_id},
           {"message_count", message_count},
           {"best_effort", best_effort},
           {"stop_reason", std::string(stop_reason)}}};
}

StreamEvent ErrorEvent(const std::string& message) {
  return {EventType::kError, {{"message", message}}};
}

StreamEvent CancelledEvent(const std::string& conversation_id) {
  return {EventType::kCancelled, {{"conversation_id", conversation_id}}};
}

}  // namespace sceneseek
