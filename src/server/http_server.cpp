#include "http_server.hpp"

#include "sceneseek/cancellation.hpp"
#include "sceneseek/chat_service.hpp"
#include "sceneseek/event_stream.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace sceneseek::server {
namespace {

constexpr std::chrono::milliseconds kFramePollInterval{100};
constexpr int kDefaultListLimit = 20;
constexpr int kMaxListLimit = 100;

void SendJson(httplib::Response& response, int status, const Json& body) {
  response.status = status;
  response.set_content(body.dump(), "application/json");
}

void SendError(httplib::Response& response, int status, const std::string& message) {
  SendJson(response, status, Json{{"error", message}});
}

// One streamed chat: the loop runs on `worker` and feeds `frames`; the HTTP
// thread drains them. Either side going away closes the queue.
struct ChatStream {
  FrameQueue frames;
  CancellationToken cancel;
  std::thread worker;

  void Abort() {
    cancel.Cancel();
    frames.Close();
  }

  ~ChatStream() {
    if (worker.joinable()) {
      worker.join();
    }
  }
};

}  // namespace

HttpServer::HttpServer(ServiceRuntime& runtime, ServerConfig config) : runtime_(runtime), config_(std::move(config)) {
  RegisterRoutes();
}

bool HttpServer::Listen() {
  spdlog::info("listening on {}:{}", config_.host, config_.port);
  return server_.listen(config_.host, config_.port);
}

void HttpServer::Stop() {
  server_.stop();
}

bool HttpServer::Authorize(const httplib::Request& request, httplib::Response& response) const {
  if (!config_.api_key.has_value()) {
    return true;
  }
  if (request.get_header_value("X-API-Key") == *config_.api_key) {
    return true;
  }
  SendError(response, 401, "unauthorized");
  return false;
}

std::string HttpServer::UserOf(const httplib::Request& request) {
  auto user = request.get_header_value("X-User-Id");
  return user.empty() ? std::string(kAnonymousUser) : user;
}

void HttpServer::RegisterRoutes() {
  server_.set_default_headers({
      {"Access-Control-Allow-Origin", config_.cors_origin},
      {"Access-Control-Allow-Headers", "Content-Type,Authorization,X-Api-Key,X-User-Id"},
      {"Access-Control-Allow-Methods", "GET,POST,DELETE,OPTIONS"},
  });

  server_.set_exception_handler([](const httplib::Request& request, httplib::Response& response,
                                   std::exception_ptr error) {
    std::string message = "unknown error";
    try {
      if (error) {
        std::rethrow_exception(error);
      }
    } catch (const std::exception& ex) {
      message = ex.what();
    }
    spdlog::error("{} {} failed: {}", request.method, request.path, message);
    SendJson(response, 500, Json{{"error", "internal server error"}, {"message", message}});
  });

  server_.set_logger([](const httplib::Request& request, const httplib::Response& response) {
    spdlog::debug("{} {} -> {}", request.method, request.path, response.status);
  });

  server_.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& response) { response.status = 204; });

  server_.Get("/health", [this](const httplib::Request&, httplib::Response& response) {
    SendJson(response, 200, Json{{"status", "ok"}, {"catalog_files", runtime_.catalog().TotalFiles()}});
  });

  server_.Post("/chat", [this](const httplib::Request& request, httplib::Response& response) {
    HandleChat(request, response);
  });
  server_.Get("/conversations", [this](const httplib::Request& request, httplib::Response& response) {
    HandleListConversations(request, response);
  });
  server_.Get(R"(/conversations/([A-Za-z0-9\-]+))", [this](const httplib::Request& request, httplib::Response& response) {
    HandleGetConversation(request, response);
  });
  server_.Delete(R"(/conversations/([A-Za-z0-9\-]+))",
                 [this](const httplib::Request& request, httplib::Response& response) {
                   HandleDeleteConversation(request, response);
                 });
}

void HttpServer::HandleChat(const httplib::Request& request, httplib::Response& response) {
  if (!Authorize(request, response)) {
    return;
  }
  const auto body = Json::parse(request.body, nullptr, false);
  if (body.is_discarded()) {
    SendError(response, 400, "request body is not valid JSON");
    return;
  }
  ChatRequest chat_request{};
  try {
    chat_request = ParseChatRequest(body, UserOf(request));
  } catch (const std::invalid_argument& ex) {
    SendError(response, 400, ex.what());
    return;
  }
  if (chat_request.query.empty() && chat_request.uploaded_image == nullptr) {
    SendError(response, 400, "query is required");
    return;
  }

  auto stream = std::make_shared<ChatStream>();
  ChatService& chat = runtime_.chat();
  stream->worker = std::thread([stream_ptr = stream.get(), &chat, chat_request = std::move(chat_request)]() {
    try {
      const auto summary = chat.Handle(chat_request, stream_ptr->frames, stream_ptr->cancel);
      spdlog::info("chat finished: state={} tool_calls={}", LoopStateName(summary.final_state), summary.tool_calls);
    } catch (const std::exception& ex) {
      spdlog::error("chat worker failed: {}", ex.what());
      stream_ptr->frames.Send(ErrorEvent(ex.what()));
    }
    stream_ptr->frames.Finish();
  });

  response.set_header("Cache-Control", "no-cache");
  response.set_header("Connection", "keep-alive");
  response.set_chunked_content_provider(
      "text/event-stream",
      [stream](std::size_t, httplib::DataSink& sink) {
        while (true) {
          auto frame = stream->frames.Pop(kFramePollInterval);
          if (frame.has_value()) {
            if (!sink.write(frame->data(), frame->size())) {
              spdlog::info("client disconnected, cancelling chat");
              stream->Abort();
              return false;
            }
            continue;
          }
          if (stream->frames.drained()) {
            sink.done();
            return true;
          }
          if (sink.is_writable && !sink.is_writable()) {
            spdlog::info("client disconnected, cancelling chat");
            stream->Abort();
            return false;
          }
        }
      },
      [stream](bool success) {
        if (!success) {
          stream->Abort();
        }
      });
}

void HttpServer::HandleListConversations(const httplib::Request& request, httplib::Response& response) {
  if (!Authorize(request, response)) {
    return;
  }
  int limit = kDefaultListLimit;
  if (request.has_param("limit")) {
    try {
      limit = std::stoi(request.get_param_value("limit"));
    } catch (const std::exception&) {
      SendError(response, 400, "limit must be an integer");
      return;
    }
    if (limit < 1 || limit > kMaxListLimit) {
      SendError(response, 400, "limit must be in [1, 100]");
      return;
    }
  }
  Json items = Json::array();
  for (const auto& summary : runtime_.conversations().ListConversations(UserOf(request), limit)) {
    items.push_back(ToJson(summary));
  }
  SendJson(response, 200, Json{{"conversations", items}, {"count", items.size()}});
}

void HttpServer::HandleGetConversation(const httplib::Request& request, httplib::Response& response) {
  if (!Authorize(request, response)) {
    return;
  }
  const std::string conversation_id = request.matches[1];
  const auto conversation = runtime_.conversations().GetConversation(conversation_id, UserOf(request));
  if (!conversation.has_value()) {
    SendError(response, 404, "conversation not found");
    return;
  }
  SendJson(response, 200, ToJson(*conversation));
}

void HttpServer::HandleDeleteConversation(const httplib::Request& request, httplib::Response& response) {
  if (!Authorize(request, response)) {
    return;
  }
  const std::string conversation_id = request.matches[1];
  if (!runtime_.conversations().DeleteConversation(conversation_id, UserOf(request))) {
    SendError(response, 404, "conversation not found");
    return;
  }
  SendJson(response, 200, Json{{"deleted", true}, {"conversation_id", conversation_id}});
}

}  // namespace sceneseek::server
