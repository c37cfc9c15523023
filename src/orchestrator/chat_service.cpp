#include "sceneseek/chat_service.hpp"

#include "sceneseek/embeddings.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace sceneseek {
namespace {

std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

AgentRunSummary Reject(EventSink& sink, const std::string& message) {
  spdlog::warn("chat request rejected: {}", message);
  AgentRunSummary summary{};
  summary.final_state = LoopState::kFailed;
  summary.transitions.push_back(LoopState::kFailed);
  summary.error = message;
  sink.Send(ErrorEvent(message));
  return summary;
}

}  // namespace

ChatRequest ParseChatRequest(const Json& body, std::string user_id) {
  if (!body.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  ChatRequest request{};
  request.user_id = std::move(user_id);
  if (body.contains("query") && !body["query"].is_null()) {
    if (!body["query"].is_string()) {
      throw std::invalid_argument("'query' must be a string");
    }
    request.query = body["query"].get<std::string>();
  }
  if (body.contains("conversation_id") && !body["conversation_id"].is_null()) {
    if (!body["conversation_id"].is_string()) {
      throw std::invalid_argument("'conversation_id' must be a string");
    }
    request.conversation_id = body["conversation_id"].get<std::string>();
  }
  if (body.contains("uploaded_image_base64") && !body["uploaded_image_base64"].is_null()) {
    if (!body["uploaded_image_base64"].is_string()) {
      throw std::invalid_argument("'uploaded_image_base64' must be a string");
    }
    auto bytes = DecodeBase64(body["uploaded_image_base64"].get<std::string>());
    if (!bytes.empty()) {
      request.uploaded_image = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));
    }
  }
  return request;
}

ChatService::ChatService(GenerationBackend& backend,
                         const ToolRegistry& tools,
                         ConversationStore& conversations,
                         const ThumbnailUrlProvider* thumbnails,
                         AgentConfig config)
    : backend_(backend), tools_(tools), conversations_(conversations), thumbnails_(thumbnails), config_(config) {}

AgentRunSummary ChatService::Handle(const ChatRequest& request, EventSink& sink, const CancellationToken& cancel) {
  const bool has_image = request.uploaded_image != nullptr && !request.uploaded_image->empty();
  auto query = Trim(request.query);
  if (query.empty()) {
    if (!has_image) {
      return Reject(sink, "a query or an uploaded image is required");
    }
    query = kDefaultImageQuery;
  }
  const std::string user_id = request.user_id.empty() ? std::string(kAnonymousUser) : request.user_id;

  std::string conversation_id{};
  if (request.conversation_id.has_value() && !request.conversation_id->empty()) {
    conversation_id = *request.conversation_id;
    if (conversations_.CheckAccess(conversation_id, user_id) == ConversationAccess::kForbidden) {
      return Reject(sink, "conversation not found: " + conversation_id);
    }
  } else {
    conversation_id = GenerateConversationId();
  }

  AgentInput input{};
  input.conversation_id = conversation_id;
  input.user_id = user_id;
  input.query = std::move(query);
  input.image = has_image ? request.uploaded_image : nullptr;
  input.history = conversations_.RecentTurns(conversation_id, user_id, config_.history_turns);

  AgentLoop loop(backend_, tools_, conversations_, thumbnails_, config_);
  return loop.Run(input, sink, cancel);
}

}  // namespace sceneseek
