#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sceneseek {

enum class EventType {
  kAgentStart,
  kToolCall,
  kToolResult,
  kThumbnail,
  kAnswerStart,
  kAnswerChunk,
  kAnswerEnd,
  kDone,
  kError,
  kCancelled,
};

std::string_view EventTypeName(EventType type);
std::optional<EventType> ParseEventType(std::string_view name);
// done, error and cancelled close a stream.
bool IsTerminal(EventType type);

struct StreamEvent {
  EventType type = EventType::kAgentStart;
  Json data = Json::object();
};

StreamEvent AgentStartEvent(const std::string& conversation_id, int max_iterations);
StreamEvent ToolCallEvent(const std::string& tool, const Json& args);
StreamEvent ToolResultEvent(const std::string& tool, std::size_t count, Json results);
StreamEvent ToolFailureEvent(const std::string& tool, std::string_view error_kind, const std::string& message);
StreamEvent ThumbnailEvent(std::int64_t file_id, const std::string& file_name, const std::string& thumbnail_url);
StreamEvent AnswerStartEvent();
StreamEvent AnswerChunkEvent(std::string text);
StreamEvent AnswerEndEvent(bool best_effort);
StreamEvent DoneEvent(const std::string& conversation_id,
                      std::size_t message_count,
                      bool best_effort,
                      std::string_view stop_reason);
StreamEvent ErrorEvent(const std::string& message);
StreamEvent CancelledEvent(const std::string& conversation_id);

}  // namespace sceneseek
