#pragma once

#include "sceneseek/agent_loop.hpp"
#include "sceneseek/cancellation.hpp"
#include "sceneseek/conversation_store.hpp"
#include "sceneseek/event_stream.hpp"
#include "sceneseek/generation.hpp"
#include "sceneseek/thumbnails.hpp"
#include "sceneseek/tool_registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sceneseek {

inline constexpr const char* kDefaultImageQuery = "Find similar images to the uploaded image";
inline constexpr const char* kAnonymousUser = "anonymous";

struct ChatRequest {
  std::string query;
  std::optional<std::string> conversation_id;
  std::shared_ptr<const std::vector<std::uint8_t>> uploaded_image;
  std::string user_id;
};

// Reads {query, conversation_id?, uploaded_image_base64?}. Throws
// std::invalid_argument on wrong field types or bad base64.
ChatRequest ParseChatRequest(const Json& body, std::string user_id);

// Entry point for one query: validates the request, resolves the
// conversation, loads its recent history and runs a fresh AgentLoop.
class ChatService {
 public:
  ChatService(GenerationBackend& backend,
              const ToolRegistry& tools,
              ConversationStore& conversations,
              const ThumbnailUrlProvider* thumbnails,
              AgentConfig config);

  AgentRunSummary Handle(const ChatRequest& request, EventSink& sink, const CancellationToken& cancel);

 private:
  GenerationBackend& backend_;
  const ToolRegistry& tools_;
  ConversationStore& conversations_;
  const ThumbnailUrlProvider* thumbnails_ = nullptr;
  AgentConfig config_{};
};

}  // namespace sceneseek
