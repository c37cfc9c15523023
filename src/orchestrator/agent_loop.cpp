#include "sceneseek/agent_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sceneseek {
namespace {

using Clock = std::chrono::steady_clock;

std::int64_t ElapsedMs(Clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

std::vector<Turn> Tail(const std::vector<Turn>& turns, std::size_t count) {
  if (turns.size() <= count) {
    return turns;
  }
  return std::vector<Turn>(turns.end() - static_cast<std::ptrdiff_t>(count), turns.end());
}

// Persisted form of a tool result: file ids instead of full records.
Json CompactResult(const ToolOutcome& outcome) {
  const auto& data = outcome.data;
  if (data.is_object() && data.contains("results") && data["results"].is_array()) {
    Json ids = Json::array();
    for (const auto& item : data["results"]) {
      ids.push_back(item.value("id", std::int64_t{0}));
    }
    return {{"count", data["results"].size()}, {"file_ids", std::move(ids)}};
  }
  return data;
}

}  // namespace

std::string_view LoopStateName(LoopState state) {
  switch (state) {
    case LoopState::kStarted:
      return "started";
    case LoopState::kDeciding:
      return "deciding";
    case LoopState::kToolExecuting:
      return "tool_executing";
    case LoopState::kAnswering:
      return "answering";
    case LoopState::kDone:
      return "done";
    case LoopState::kFailed:
      return "failed";
    case LoopState::kCancelled:
      return "cancelled";
  }
  return "failed";
}

std::string_view StopReasonName(StopReason reason) {
  switch (reason) {
    case StopReason::kCompleted:
      return "completed";
    case StopReason::kIterationLimit:
      return "iteration_limit";
    case StopReason::kToolTimeout:
      return "tool_timeout";
    case StopReason::kLoopTimeout:
      return "loop_timeout";
  }
  return "completed";
}

AgentLoop::AgentLoop(GenerationBackend& backend,
                     const ToolRegistry& tools,
                     ConversationStore& conversations,
                     const ThumbnailUrlProvider* thumbnails,
                     AgentConfig config)
    : backend_(backend), tools_(tools), conversations_(conversations), thumbnails_(thumbnails), config_(config) {
  if (config_.max_iterations < 1) {
    throw std::invalid_argument("max_iterations must be >= 1");
  }
}

AgentLoop::~AgentLoop() {
  for (auto& pending : abandoned_) {
    if (pending.valid()) {
      pending.wait();
    }
  }
}

AgentRunSummary AgentLoop::Run(const AgentInput& input, EventSink& sink, const CancellationToken& cancel) {
  AgentRunSummary summary{};
  const auto started = Clock::now();
  const auto deadline = started + config_.loop_timeout;
  bool transport_lost = false;

  auto enter = [&summary](LoopState state) {
    summary.transitions.push_back(state);
    summary.final_state = state;
  };
  auto emit = [&sink, &transport_lost](const StreamEvent& event) {
    if (transport_lost) {
      return false;
    }
    if (!sink.Send(event)) {
      transport_lost = true;
    }
    return !transport_lost;
  };
  const std::function<bool()> should_stop = [&cancel, &sink, &transport_lost]() {
    return cancel.cancelled() || transport_lost || !sink.IsOpen();
  };
  auto finish_cancelled = [&]() {
    enter(LoopState::kCancelled);
    spdlog::info("loop cancelled: conversation={} after {} decisions", input.conversation_id, summary.decisions);
    if (!transport_lost && sink.IsOpen()) {
      emit(CancelledEvent(input.conversation_id));
    }
    return summary;
  };

  const Turn user_turn{TurnKind::kUser, input.query, NowMillis(), {}};
  const auto history = Tail(input.history, config_.history_turns);
  std::vector<ToolExchange> exchanges{};
  std::vector<Turn> tool_turns{};
  std::vector<ToolCall> executed_calls{};
  std::optional<std::string> draft_answer;

  enter(LoopState::kStarted);
  spdlog::info("loop started: conversation={} max_iterations={} history={}",
               input.conversation_id,
               config_.max_iterations,
               history.size());
  emit(AgentStartEvent(input.conversation_id, config_.max_iterations));

  try {
    while (true) {
      if (should_stop()) {
        return finish_cancelled();
      }
      if (summary.decisions >= config_.max_iterations) {
        summary.stop_reason = StopReason::kIterationLimit;
        summary.best_effort = true;
        spdlog::warn("iteration limit {} reached, forcing answer", config_.max_iterations);
        break;
      }
      if (Clock::now() >= deadline) {
        summary.stop_reason = StopReason::kLoopTimeout;
        summary.best_effort = true;
        spdlog::warn("loop timeout reached before decision {}, forcing answer", summary.decisions + 1);
        break;
      }

      enter(LoopState::kDeciding);
      ++summary.decisions;
      spdlog::debug("deciding: iteration {}/{}", summary.decisions, config_.max_iterations);
      DecisionRequest request{};
      request.query = input.query;
      request.has_image = input.image != nullptr && !input.image->empty();
      request.history = history;
      request.tool_history = exchanges;
      request.iteration = summary.decisions;
      request.max_iterations = config_.max_iterations;
      request.tools = tools_.List();
      const auto decision = backend_.Decide(request);
      if (should_stop()) {
        return finish_cancelled();
      }
      if (decision.tool_calls.empty()) {
        draft_answer = decision.final_answer;
        break;
      }

      enter(LoopState::kToolExecuting);
      for (const auto& call : decision.tool_calls) {
        emit(ToolCallEvent(call.name, call.args));
      }
      auto batch = ExecuteTools(decision.tool_calls, input, deadline, should_stop);
      if (batch.cancelled || should_stop()) {
        return finish_cancelled();
      }

      for (std::size_t i = 0; i < decision.tool_calls.size(); ++i) {
        auto call = decision.tool_calls[i];
        const auto& outcome = batch.outcomes[i];
        for (const auto& event : ToolResultEvents(call, outcome)) {
          emit(event);
        }
        if (outcome.ok) {
          call.result = CompactResult(outcome);
        } else {
          call.failure = std::string(ToolFailureKindName(outcome.failure.value_or(ToolFailureKind::kExecutionError))) +
                         ": " + outcome.message;
        }
        tool_turns.push_back(Turn{TurnKind::kToolCall, call.name, NowMillis(), {call}});
        executed_calls.push_back(call);
        exchanges.push_back(ToolExchange{decision.tool_calls[i], outcome, summary.decisions});
        ++summary.tool_calls;
      }
      if (batch.timed_out) {
        summary.stop_reason = StopReason::kToolTimeout;
        summary.best_effort = true;
        spdlog::warn("tool timeout after {} ms, forcing answer", config_.tool_timeout.count());
        break;
      }
      if (batch.loop_deadline_hit) {
        summary.stop_reason = StopReason::kLoopTimeout;
        summary.best_effort = true;
        spdlog::warn("loop timeout during tool execution, forcing answer");
        break;
      }
    }
    if (should_stop()) {
      return finish_cancelled();
    }

    enter(LoopState::kAnswering);
    emit(AnswerStartEvent());
    AnswerRequest answer_request{};
    answer_request.query = input.query;
    answer_request.history = history;
    answer_request.tool_history = exchanges;
    answer_request.best_effort = summary.best_effort;
    answer_request.draft_answer = draft_answer;
    const auto answer_deadline = std::max(deadline, Clock::now() + config_.answer_grace);
    bool answer_timed_out = false;
    backend_.StreamAnswer(answer_request, [&](std::string_view chunk) {
      if (should_stop()) {
        return false;
      }
      if (Clock::now() >= answer_deadline) {
        answer_timed_out = true;
        return false;
      }
      summary.answer.append(chunk);
      return emit(AnswerChunkEvent(std::string(chunk)));
    });
    if (should_stop()) {
      return finish_cancelled();
    }
    if (answer_timed_out) {
      // A deadline while answering degrades to a partial answer.
      summary.best_effort = true;
      if (summary.stop_reason == StopReason::kCompleted) {
        summary.stop_reason = StopReason::kLoopTimeout;
      }
      spdlog::warn("loop timeout while answering, closing with partial answer");
    }
    emit(AnswerEndEvent(summary.best_effort));
    if (should_stop()) {
      return finish_cancelled();
    }

    std::vector<Turn> turns{};
    turns.reserve(tool_turns.size() + 2);
    turns.push_back(user_turn);
    turns.insert(turns.end(), tool_turns.begin(), tool_turns.end());
    turns.push_back(Turn{TurnKind::kAssistant, summary.answer, NowMillis(), executed_calls});
    const auto receipt = conversations_.AppendTurns(input.conversation_id, input.user_id, turns);
    summary.message_count = receipt.message_count_after;

    enter(LoopState::kDone);
    spdlog::info("loop done: conversation={} decisions={} tools={} stop_reason={} elapsed_ms={}",
                 input.conversation_id,
                 summary.decisions,
                 summary.tool_calls,
                 StopReasonName(summary.stop_reason),
                 ElapsedMs(started));
    emit(DoneEvent(input.conversation_id, summary.message_count, summary.best_effort, StopReasonName(summary.stop_reason)));
    return summary;
  } catch (const std::exception& e) {
    enter(LoopState::kFailed);
    summary.error = e.what();
    spdlog::error("loop failed: conversation={} error={}", input.conversation_id, e.what());
    try {
      conversations_.AppendTurn(input.conversation_id, input.user_id, user_turn);
    } catch (const std::exception& persist_error) {
      spdlog::error("could not record user turn for failed run {}: {}", input.conversation_id, persist_error.what());
    }
    emit(ErrorEvent(e.what()));
    return summary;
  }
}

AgentLoop::ToolBatch AgentLoop::ExecuteTools(const std::vector<ToolCall>& calls,
                                             const AgentInput& input,
                                             Clock::time_point loop_deadline,
                                             const std::function<bool()>& should_stop) {
  ToolBatch batch{};
  batch.outcomes.resize(calls.size());
  const ToolContext context{input.image};
  const auto batch_start = Clock::now();
  const auto tool_deadline = batch_start + config_.tool_timeout;

  std::vector<std::future<ToolOutcome>> pending{};
  pending.reserve(calls.size());
  for (const auto& call : calls) {
    spdlog::info("tool call: {} {}", call.name, call.args.dump());
    pending.push_back(std::async(std::launch::async, [this, name = call.name, args = call.args, context]() {
      return tools_.Invoke(name, args, context);
    }));
  }

  std::vector<bool> finished(calls.size(), false);
  std::size_t remaining = calls.size();
  while (remaining > 0) {
    if (should_stop()) {
      batch.cancelled = true;
      break;
    }
    const auto now = Clock::now();
    if (now >= loop_deadline) {
      batch.loop_deadline_hit = true;
      break;
    }
    if (now >= tool_deadline) {
      batch.timed_out = true;
      break;
    }
    bool waited = false;
    for (std::size_t i = 0; i < pending.size(); ++i) {
      if (finished[i]) {
        continue;
      }
      const auto wait = waited ? std::chrono::milliseconds(0) : config_.poll_interval;
      waited = true;
      if (pending[i].wait_for(wait) != std::future_status::ready) {
        continue;
      }
      batch.outcomes[i] = pending[i].get();
      finished[i] = true;
      --remaining;
      spdlog::info("tool {} finished in {} ms: ok={} results={}",
                   calls[i].name,
                   ElapsedMs(batch_start),
                   batch.outcomes[i].ok,
                   batch.outcomes[i].result_count());
    }
  }

  for (std::size_t i = 0; i < pending.size(); ++i) {
    if (finished[i]) {
      continue;
    }
    spdlog::warn("tool {} abandoned after {} ms", calls[i].name, ElapsedMs(batch_start));
    batch.outcomes[i] = ToolOutcome::Failure(
        ToolFailureKind::kExecutionError,
        "tool did not finish within " + std::to_string(config_.tool_timeout.count()) + " ms");
    abandoned_.push_back(std::move(pending[i]));
  }
  return batch;
}

std::vector<StreamEvent> AgentLoop::ToolResultEvents(const ToolCall& call, const ToolOutcome& outcome) const {
  std::vector<StreamEvent> events{};
  if (!outcome.ok) {
    events.push_back(ToolFailureEvent(call.name,
                                      ToolFailureKindName(outcome.failure.value_or(ToolFailureKind::kExecutionError)),
                                      outcome.message));
    return events;
  }

  const auto& data = outcome.data;
  if (!data.is_object() || !data.contains("results") || !data["results"].is_array()) {
    auto event = ToolResultEvent(call.name, 1, Json::array());
    event.data["data"] = data;
    events.push_back(std::move(event));
    return events;
  }

  const auto& results = data["results"];
  Json shown = Json::array();
  std::vector<StreamEvent> thumbnails{};
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto& item = results[i];
    std::optional<std::string> url;
    if (thumbnails_ != nullptr && thumbnails.size() < config_.max_thumbnails_per_result) {
      url = thumbnails_->UrlFor(SearchResultFromJson(item));
      if (url.has_value()) {
        thumbnails.push_back(
            ThumbnailEvent(item.value("id", std::int64_t{0}), item.value("name", std::string()), *url));
      }
    }
    if (i < config_.results_in_event) {
      Json entry = item;
      if (url.has_value()) {
        entry["thumbnail_url"] = *url;
      }
      shown.push_back(std::move(entry));
    }
  }
  events.push_back(ToolResultEvent(call.name, results.size(), std::move(shown)));
  for (auto& event : thumbnails) {
    events.push_back(std::move(event));
  }
  return events;
}

}  // namespace sceneseek
