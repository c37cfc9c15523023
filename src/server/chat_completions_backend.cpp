#include "sceneseek/chat_completions_backend.hpp"

#include "sceneseek/errors.hpp"
#include "sceneseek/react_format.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace sceneseek {
namespace {

constexpr const char* kSystemPrompt =
    "You are a search assistant for an animation studio's production file catalog. Use the tools to find files "
    "and answer only from their results.";
constexpr std::chrono::seconds kConnectTimeout{5};

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

httplib::Client MakeClient(const PlannerConfig& config, const CompletionsEndpoint& endpoint) {
  httplib::Client client(endpoint.base_url);
  client.set_connection_timeout(kConnectTimeout);
  client.set_read_timeout(config.request_timeout);
  client.set_write_timeout(config.request_timeout);
  if (config.api_key.has_value()) {
    client.set_bearer_token_auth(*config.api_key);
  }
  return client;
}

}  // namespace

CompletionsEndpoint ParseCompletionsEndpoint(std::string_view endpoint) {
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.remove_suffix(1);
  }
  const auto scheme = endpoint.find("://");
  const auto path_start = endpoint.find('/', scheme == std::string_view::npos ? 0 : scheme + 3);
  CompletionsEndpoint parsed{};
  parsed.base_url = std::string(endpoint.substr(0, path_start));
  std::string prefix = path_start == std::string_view::npos ? std::string() : std::string(endpoint.substr(path_start));
  constexpr std::string_view kSuffix = "/chat/completions";
  if (prefix.size() >= kSuffix.size() && prefix.compare(prefix.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
    parsed.path = prefix;
    return parsed;
  }
  if (prefix.empty()) {
    prefix = "/v1";
  }
  parsed.path = prefix + std::string(kSuffix);
  return parsed;
}

std::string ExtractStreamDelta(std::string_view payload) {
  payload = TrimView(payload);
  if (payload.empty() || payload == "[DONE]") {
    return {};
  }
  const auto chunk = Json::parse(payload.begin(), payload.end(), nullptr, false);
  if (chunk.is_discarded() || !chunk.is_object()) {
    return {};
  }
  const auto choices = chunk.find("choices");
  if (choices == chunk.end() || !choices->is_array() || choices->empty()) {
    return {};
  }
  const auto& choice = (*choices)[0];
  const auto delta = choice.find("delta");
  if (delta == choice.end() || !delta->is_object()) {
    return {};
  }
  const auto content = delta->find("content");
  if (content == delta->end() || !content->is_string()) {
    return {};
  }
  return content->get<std::string>();
}

ChatCompletionsBackend::ChatCompletionsBackend(PlannerConfig config)
    : config_(std::move(config)), endpoint_(ParseCompletionsEndpoint(config_.endpoint)) {
  spdlog::info("chat completions backend: {}{} model={}", endpoint_.base_url, endpoint_.path, config_.model);
}

Json ChatCompletionsBackend::BuildBody(const std::string& prompt, bool stream, bool stop_at_observation) const {
  Json body = {
      {"model", config_.model},
      {"messages", Json::array({
                       Json{{"role", "system"}, {"content", kSystemPrompt}},
                       Json{{"role", "user"}, {"content", prompt}},
                   })},
      {"temperature", config_.temperature},
      {"stream", stream},
  };
  if (stop_at_observation) {
    body["stop"] = Json::array({"Observation:"});
  }
  return body;
}

Decision ChatCompletionsBackend::Decide(const DecisionRequest& request) {
  auto client = MakeClient(config_, endpoint_);
  const auto body = BuildBody(BuildDecisionPrompt(request), false, true).dump();
  const auto started = std::chrono::steady_clock::now();
  auto result = client.Post(endpoint_.path, body, "application/json");
  if (!result) {
    throw GenerationBackendUnavailable("chat completions request failed: " + httplib::to_string(result.error()));
  }
  if (result->status < 200 || result->status >= 300) {
    throw GenerationBackendUnavailable("chat completions returned HTTP " + std::to_string(result->status));
  }
  const auto response = Json::parse(result->body, nullptr, false);
  if (response.is_discarded() || !response.contains("choices") || !response["choices"].is_array() ||
      response["choices"].empty()) {
    throw GenerationBackendUnavailable("chat completions returned a malformed response");
  }
  const auto message = response["choices"][0].value("message", Json::object());
  const auto content = message.find("content");
  const std::string text = content != message.end() && content->is_string() ? content->get<std::string>() : "";
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  spdlog::debug("decision step {} took {} ms ({} chars)", request.iteration, elapsed, text.size());
  return ParseReactResponse(text);
}

void ChatCompletionsBackend::StreamAnswer(const AnswerRequest& request, const ChunkCallback& on_chunk) {
  auto client = MakeClient(config_, endpoint_);

  std::string pending{};
  bool stopped = false;
  httplib::Request http_request{};
  http_request.method = "POST";
  http_request.path = endpoint_.path;
  http_request.set_header("Content-Type", "application/json");
  http_request.set_header("Accept", "text/event-stream");
  http_request.body = BuildBody(BuildAnswerPrompt(request), true, false).dump();
  http_request.content_receiver = [&](const char* data, std::size_t length, std::uint64_t, std::uint64_t) {
    pending.append(data, length);
    std::size_t line_end = 0;
    while ((line_end = pending.find('\n')) != std::string::npos) {
      const std::string line = pending.substr(0, line_end);
      pending.erase(0, line_end + 1);
      const auto trimmed = TrimView(line);
      if (trimmed.rfind("data:", 0) != 0) {
        continue;
      }
      const auto delta = ExtractStreamDelta(trimmed.substr(5));
      if (!delta.empty() && !on_chunk(delta)) {
        stopped = true;
        return false;
      }
    }
    return true;
  };

  httplib::Response response{};
  httplib::Error error = httplib::Error::Success;
  const bool sent = client.send(http_request, response, error);
  if (stopped) {
    return;
  }
  if (!sent) {
    throw GenerationBackendUnavailable("chat completions stream failed: " + httplib::to_string(error));
  }
  if (response.status < 200 || response.status >= 300) {
    throw GenerationBackendUnavailable("chat completions stream returned HTTP " + std::to_string(response.status));
  }
}

}  // namespace sceneseek
