#pragma once

#include "sceneseek/config.hpp"
#include "sceneseek/generation.hpp"

#include <string>
#include <string_view>

namespace sceneseek {

// Base URL and request path for an OpenAI-compatible endpoint.
// "http://host:8080" and "http://host:8080/v1" both resolve to
// "/v1/chat/completions"; a full completions path is kept as given.
struct CompletionsEndpoint {
  std::string base_url;
  std::string path;
};

CompletionsEndpoint ParseCompletionsEndpoint(std::string_view endpoint);

// Pulls choices[0].delta.content out of one streamed "data:" payload. Empty
// for role-only deltas, "[DONE]" and unparseable payloads.
std::string ExtractStreamDelta(std::string_view payload);

// Decides and answers through an OpenAI-compatible /v1/chat/completions
// server using the ReAct text protocol. Decisions are single requests,
// answers are streamed. Transport failures and non-2xx statuses raise
// GenerationBackendUnavailable. Each call uses its own connection.
class ChatCompletionsBackend final : public GenerationBackend {
 public:
  explicit ChatCompletionsBackend(PlannerConfig config);

  Decision Decide(const DecisionRequest& request) override;
  void StreamAnswer(const AnswerRequest& request, const ChunkCallback& on_chunk) override;

 private:
  Json BuildBody(const std::string& prompt, bool stream, bool stop_at_observation) const;

  PlannerConfig config_;
  CompletionsEndpoint endpoint_;
};

}  // namespace sceneseek
