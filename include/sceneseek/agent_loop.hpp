#pragma once

#include "sceneseek/cancellation.hpp"
#include "sceneseek/conversation_store.hpp"
#include "sceneseek/event_stream.hpp"
#include "sceneseek/generation.hpp"
#include "sceneseek/thumbnails.hpp"
#include "sceneseek/tool_registry.hpp"
#include "sceneseek/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sceneseek {

enum class LoopState {
  kStarted,
  kDeciding,
  kToolExecuting,
  kAnswering,
  kDone,
  kFailed,
  kCancelled,
};

std::string_view LoopStateName(LoopState state);

enum class StopReason {
  kCompleted,
  kIterationLimit,
  kToolTimeout,
  kLoopTimeout,
};

std::string_view StopReasonName(StopReason reason);

struct AgentConfig {
  int max_iterations = 5;
  std::size_t history_turns = 10;
  std::chrono::milliseconds tool_timeout{30000};
  std::chrono::milliseconds loop_timeout{120000};
  // Minimum time Answering gets, even when the loop deadline has passed.
  std::chrono::milliseconds answer_grace{10000};
  std::size_t max_thumbnails_per_result = 10;
  std::size_t results_in_event = 10;
  std::chrono::milliseconds poll_interval{20};
};

struct AgentInput {
  std::string conversation_id;
  std::string user_id;
  std::string query;
  std::shared_ptr<const std::vector<std::uint8_t>> image;
  std::vector<Turn> history;
};

struct AgentRunSummary {
  LoopState final_state = LoopState::kStarted;
  StopReason stop_reason = StopReason::kCompleted;
  bool best_effort = false;
  int decisions = 0;
  std::size_t tool_calls = 0;
  std::size_t message_count = 0;
  std::string answer;
  std::optional<std::string> error;
  std::vector<LoopState> transitions;
};

// Drives one query through Started -> Deciding -> (ToolExecuting ->
// Deciding)* -> Answering -> Done, or to Failed / Cancelled. Every run ends
// with exactly one terminal event: done, error or cancelled.
//
// Tool calls from one decision run concurrently and are joined before the
// next decision. A tool still running after a timeout or cancellation is
// abandoned: its result is discarded and the destructor waits for it.
class AgentLoop {
 public:
  AgentLoop(GenerationBackend& backend,
            const ToolRegistry& tools,
            ConversationStore& conversations,
            const ThumbnailUrlProvider* thumbnails,
            AgentConfig config = {});
  ~AgentLoop();

  AgentLoop(const AgentLoop&) = delete;
  AgentLoop& operator=(const AgentLoop&) = delete;

  AgentRunSummary Run(const AgentInput& input, EventSink& sink, const CancellationToken& cancel);

  [[nodiscard]] const AgentConfig& config() const { return config_; }

 private:
  struct ToolBatch {
    std::vector<ToolOutcome> outcomes;
    bool timed_out = false;
    bool loop_deadline_hit = false;
    bool cancelled = false;
  };

  ToolBatch ExecuteTools(const std::vector<ToolCall>& calls,
                         const AgentInput& input,
                         std::chrono::steady_clock::time_point loop_deadline,
                         const std::function<bool()>& should_stop);
  std::vector<StreamEvent> ToolResultEvents(const ToolCall& call, const ToolOutcome& outcome) const;

  GenerationBackend& backend_;
  const ToolRegistry& tools_;
  ConversationStore& conversations_;
  const ThumbnailUrlProvider* thumbnails_ = nullptr;
  AgentConfig config_{};
  std::vector<std::future<ToolOutcome>> abandoned_{};
};

}  // namespace sceneseek
