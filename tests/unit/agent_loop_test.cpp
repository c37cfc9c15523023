#include "sceneseek/agent_loop.hpp"
#include "sceneseek/catalog_tools.hpp"
#include "sceneseek/rule_based_planner.hpp"

#include "../agent_doubles.hpp"
#include "../catalog_fixture.hpp"
#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using sceneseek::EventType;
using sceneseek::Json;
using sceneseek::LoopState;
using sceneseek::tests::RecordingSink;
using sceneseek::tests::ScriptedBackend;
namespace tool_names = sceneseek::tool_names;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void RequireSingleTerminal(const RecordingSink& sink, EventType expected) {
  Require(!sink.events().empty() && sink.events().front().type == EventType::kAgentStart, "stream opens with agent_start");
  Require(sink.TerminalCount() == 1, "exactly one terminal event");
  Require(sink.events().back().type == expected,
          "stream must close with " + std::string(sceneseek::EventTypeName(expected)));
}

sceneseek::AgentInput MakeInput(const std::string& query) {
  sceneseek::AgentInput input{};
  input.conversation_id = "conv-1";
  input.user_id = "artist";
  input.query = query;
  return input;
}

sceneseek::ToolDefinition SlowTool(std::string name, std::chrono::milliseconds delay) {
  sceneseek::ToolDefinition definition{};
  definition.name = std::move(name);
  definition.description = "Sleeps, then returns nothing.";
  definition.signature = definition.name + "() -> file_list";
  definition.execute = [delay](const Json&, const sceneseek::ToolContext&) {
    std::this_thread::sleep_for(delay);
    return Json{{"count", 0}, {"results", Json::array()}};
  };
  return definition;
}

void ScenarioFilterQueryEndToEnd() {
  sceneseek::tests::Log("scenario: 4K renders end to end");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  sceneseek::RuleBasedPlanner planner;
  const sceneseek::StaticThumbnailUrlProvider thumbnails("https://thumbs.test/", 60);
  sceneseek::AgentConfig config{};
  config.max_thumbnails_per_result = 2;
  sceneseek::AgentLoop loop(planner, fixture.registry(), conversations, &thumbnails, config);

  RecordingSink sink;
  const sceneseek::CancellationToken cancel;
  const auto summary = loop.Run(MakeInput("Show me 4K renders"), sink, cancel);

  Require(summary.final_state == LoopState::kDone && !summary.best_effort, "run completes normally");
  Require(summary.transitions == std::vector<LoopState>({LoopState::kStarted,
                                                         LoopState::kDeciding,
                                                         LoopState::kToolExecuting,
                                                         LoopState::kDeciding,
                                                         LoopState::kAnswering,
                                                         LoopState::kDone}),
          "state machine path");
  RequireSingleTerminal(sink, EventType::kDone);

  const auto* call = sink.First(EventType::kToolCall);
  Require(call != nullptr && call->data["tool"] == tool_names::kFilterSearch, "filter tool chosen");
  Require(call->data["args"]["min_resolution_x"] == 3840, "4K bound passed to the tool");

  const auto* result = sink.First(EventType::kToolResult);
  Require(result->data["ok"] == true && result->data["count"] == 4, "four 4K files found");
  Require(result->data["results"][0]["name"] == "forest_env_8k.exr", "newest 4K file first");
  Require(result->data["results"][0]["thumbnail_url"] == "https://thumbs.test/skyfall/images/2_thumb.jpg?expires=60",
          "result entries carry their thumbnail url");

  Require(sink.Count(EventType::kThumbnail) == 2, "thumbnail events are capped per result");
  Require(sink.Count(EventType::kAnswerStart) == 1 && sink.Count(EventType::kAnswerEnd) == 1, "one answer block");
  Require(summary.answer == sink.AnswerText(), "summary answer equals the streamed chunks");
  Require(summary.answer.find("forest_env_8k.exr") != std::string::npos, "answer names the files");

  const auto& done = sink.events().back().data;
  Require(done["conversation_id"] == "conv-1" && done["message_count"] == 3, "done reports the stored turns");
  Require(done["stop_reason"] == "completed" && done["best_effort"] == false, "done reports a normal stop");

  const auto stored = conversations.GetConversation("conv-1", "artist");
  Require(stored.has_value() && stored->turns.size() == 3, "user, tool and assistant turns persisted");
  Require(stored->turns[0].kind == sceneseek::TurnKind::kUser && stored->turns[0].content == "Show me 4K renders",
          "user turn first");
  Require(stored->turns[1].kind == sceneseek::TurnKind::kToolCall &&
              stored->turns[1].tool_calls[0].result.value()["file_ids"].size() == 4,
          "tool turn stores file ids");
  Require(stored->turns[2].kind == sceneseek::TurnKind::kAssistant && stored->turns[2].content == summary.answer,
          "assistant turn stores the answer");
}

void ScenarioUploadedImage() {
  sceneseek::tests::Log("scenario: uploaded image");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  sceneseek::RuleBasedPlanner planner;
  sceneseek::AgentLoop loop(planner, fixture.registry(), conversations, nullptr);

  auto input = MakeInput("Find similar images to the uploaded image");
  input.image = std::make_shared<const std::vector<std::uint8_t>>(sceneseek::tests::PngBytes(3));
  RecordingSink sink;
  const auto summary = loop.Run(input, sink, sceneseek::CancellationToken{});

  Require(summary.final_state == LoopState::kDone, "image run completes");
  Require(sink.First(EventType::kToolCall)->data["tool"] == tool_names::kUploadedImageSearch, "image search chosen");
  Require(sink.First(EventType::kToolResult)->data["count"] == 5, "every visual file is a candidate");
  Require(sink.Count(EventType::kThumbnail) == 0, "no thumbnails without a provider");
  RequireSingleTerminal(sink, EventType::kDone);
}

void ScenarioFallbackAfterFailure() {
  sceneseek::tests::Log("scenario: fallback after a failed tool");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  sceneseek::RuleBasedPlanner planner;
  sceneseek::AgentLoop loop(planner, fixture.registry(), conversations, nullptr);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("show me"), sink, sceneseek::CancellationToken{});

  Require(summary.final_state == LoopState::kDone && summary.decisions == 3 && summary.tool_calls == 2,
          "semantic failure, keyword fallback, then answer");
  const auto* failed = sink.First(EventType::kToolResult);
  Require(failed->data["ok"] == false && failed->data["error_kind"] == "execution_error",
          "tool failure is reported, not fatal");
  Require(sink.Count(EventType::kToolResult) == 2 && sink.Count(EventType::kError) == 0, "no error event");
  Require(summary.answer == "I could not find any files matching \"show me\".", "empty answer explained");
  RequireSingleTerminal(sink, EventType::kDone);

  const auto stored = conversations.GetConversation("conv-1", "artist");
  Require(stored->turns[1].tool_calls[0].failure.has_value(), "failed tool call persisted with its failure");
}

void ScenarioIterationLimit() {
  sceneseek::tests::Log("scenario: iteration limit");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.Queue(sceneseek::tests::CallTool(tool_names::kKeywordSearch, {{"query", "castle"}}));
  sceneseek::AgentConfig config{};
  config.max_iterations = 2;
  sceneseek::AgentLoop loop(backend, fixture.registry(), conversations, nullptr, config);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("keep searching"), sink, sceneseek::CancellationToken{});

  Require(summary.final_state == LoopState::kDone, "limit still produces an answer");
  Require(summary.decisions == 2 && summary.tool_calls == 2, "exactly max_iterations decisions");
  Require(summary.best_effort && summary.stop_reason == sceneseek::StopReason::kIterationLimit, "best effort");
  Require(backend.requests()[1].tool_history.size() == 1 && backend.requests()[1].iteration == 2,
          "second decision sees the first observation");
  Require(backend.answer_requests().size() == 1 && backend.answer_requests()[0].best_effort,
          "answer is told it is partial");

  const auto* answer_end = sink.First(EventType::kAnswerEnd);
  Require(answer_end->data["best_effort"] == true, "answer_end flags best effort");
  Require(sink.events().back().data["stop_reason"] == "iteration_limit", "done names the stop reason");
  RequireSingleTerminal(sink, EventType::kDone);
}

void ScenarioUnknownToolAndDraft() {
  sceneseek::tests::Log("scenario: unknown tool and draft answer");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.Queue(sceneseek::tests::CallTool("teleport", Json::object()));
  sceneseek::Decision final_decision{};
  final_decision.final_answer = std::string("nothing to teleport");
  backend.Queue(final_decision);
  sceneseek::AgentLoop loop(backend, fixture.registry(), conversations, nullptr);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("teleport the castle"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kDone && summary.decisions == 2, "unknown tool does not end the run");
  Require(sink.First(EventType::kToolResult)->data["error_kind"] == "not_found", "unknown tool is not_found");
  Require(backend.answer_requests()[0].draft_answer == "nothing to teleport", "draft answer handed to answering");
  Require(summary.answer == "Here you go.", "scripted answer streamed");
}

void ScenarioHistoryWindow() {
  sceneseek::tests::Log("scenario: history window");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  sceneseek::AgentConfig config{};
  config.history_turns = 2;
  sceneseek::AgentLoop loop(backend, fixture.registry(), conversations, nullptr, config);

  auto input = MakeInput("and the dragon?");
  for (int i = 0; i < 5; ++i) {
    input.history.push_back(sceneseek::Turn{sceneseek::TurnKind::kUser, "turn " + std::to_string(i), i, {}});
  }
  RecordingSink sink;
  loop.Run(input, sink, sceneseek::CancellationToken{});
  const auto& history = backend.requests().front().history;
  Require(history.size() == 2 && history[0].content == "turn 3" && history[1].content == "turn 4",
          "only the most recent turns reach the backend");
  Require(backend.requests().front().tools.size() == 7, "backend sees the tool catalog");
}

void ScenarioTransportClosed() {
  sceneseek::tests::Log("scenario: transport closed");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  sceneseek::RuleBasedPlanner planner;
  sceneseek::AgentLoop loop(planner, fixture.registry(), conversations, nullptr);

  RecordingSink sink(1);
  const auto summary = loop.Run(MakeInput("Show me 4K renders"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kCancelled, "lost transport cancels the run");
  Require(sink.events().size() == 1 && sink.TerminalCount() == 0, "nothing is sent after the transport is gone");
  Require(conversations.CheckAccess("conv-1", "artist") == sceneseek::ConversationAccess::kAbsent,
          "cancelled runs persist nothing");
}

void ScenarioCancelledBeforeStart() {
  sceneseek::tests::Log("scenario: cancelled token");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  sceneseek::AgentLoop loop(backend, fixture.registry(), conversations, nullptr);

  sceneseek::CancellationToken cancel;
  cancel.Cancel();
  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("anything"), sink, cancel);
  Require(summary.final_state == LoopState::kCancelled && summary.decisions == 0, "no decision after cancel");
  Require(backend.requests().empty(), "backend never consulted");
  RequireSingleTerminal(sink, EventType::kCancelled);
  Require(conversations.CheckAccess("conv-1", "artist") == sceneseek::ConversationAccess::kAbsent,
          "cancelled runs persist nothing");
}

void ScenarioCancelledDuringTools() {
  sceneseek::tests::Log("scenario: cancelled during tools");
  sceneseek::ToolRegistry registry;
  registry.Register(SlowTool("slow_search", std::chrono::milliseconds(300)));
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.Queue(sceneseek::tests::CallTool("slow_search", Json::object()));
  sceneseek::AgentLoop loop(backend, registry, conversations, nullptr);

  sceneseek::CancellationToken cancel;
  std::thread canceller([&cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    cancel.Cancel();
  });
  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("slow"), sink, cancel);
  canceller.join();

  Require(summary.final_state == LoopState::kCancelled, "cancel interrupts tool execution");
  Require(sink.Count(EventType::kToolResult) == 0, "abandoned tool results are discarded");
  RequireSingleTerminal(sink, EventType::kCancelled);
}

void ScenarioToolTimeout() {
  sceneseek::tests::Log("scenario: tool timeout");
  sceneseek::ToolRegistry registry;
  registry.Register(SlowTool("slow_search", std::chrono::milliseconds(300)));
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.Queue(sceneseek::tests::CallTool("slow_search", Json::object()));
  sceneseek::AgentConfig config{};
  config.tool_timeout = std::chrono::milliseconds(50);
  sceneseek::AgentLoop loop(backend, registry, conversations, nullptr, config);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("slow"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kDone, "timeout still answers");
  Require(summary.best_effort && summary.stop_reason == sceneseek::StopReason::kToolTimeout, "tool timeout stop");
  Require(backend.requests().size() == 1, "no further decisions after a timeout");
  const auto* result = sink.First(EventType::kToolResult);
  Require(result->data["ok"] == false && result->data["error"] == "tool did not finish within 50 ms",
          "timed out tool reported as failed");
  Require(sink.events().back().data["stop_reason"] == "tool_timeout", "done names the timeout");
  RequireSingleTerminal(sink, EventType::kDone);
}

void ScenarioLoopTimeout() {
  sceneseek::tests::Log("scenario: loop timeout");
  sceneseek::ToolRegistry registry;
  registry.Register(SlowTool("slow_search", std::chrono::milliseconds(200)));
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.Queue(sceneseek::tests::CallTool("slow_search", Json::object()));
  sceneseek::AgentConfig config{};
  config.loop_timeout = std::chrono::milliseconds(40);
  sceneseek::AgentLoop loop(backend, registry, conversations, nullptr, config);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("slow"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kDone && summary.best_effort, "loop timeout degrades to best effort");
  Require(summary.stop_reason == sceneseek::StopReason::kLoopTimeout, "loop timeout stop");
  Require(sink.Count(EventType::kAnswerChunk) >= 1 && summary.answer == "Here you go.",
          "the forced answer still streams inside its grace budget");
  Require(sink.First(EventType::kAnswerEnd)->data["best_effort"] == true, "answer_end flags best effort");
  Require(backend.answer_requests().size() == 1 && backend.answer_requests()[0].best_effort &&
              backend.answer_requests()[0].tool_history.size() == 1,
          "answer is grounded in the gathered results");
  RequireSingleTerminal(sink, EventType::kDone);
  const auto turns = conversations.RecentTurns("conv-1", "artist", 10);
  Require(!turns.empty() && turns.back().content == "Here you go.", "the partial answer is persisted");
}

void ScenarioAnswerGraceExpires() {
  sceneseek::tests::Log("scenario: answer grace expires");
  sceneseek::ToolRegistry registry;
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.Answer({"one ", "two ", "three ", "four ", "five "});
  backend.PaceChunks(std::chrono::milliseconds(30));
  sceneseek::AgentConfig config{};
  config.loop_timeout = std::chrono::milliseconds(10);
  config.answer_grace = std::chrono::milliseconds(70);
  sceneseek::AgentLoop loop(backend, registry, conversations, nullptr, config);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("pace"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kDone && summary.best_effort, "grace expiry degrades to best effort");
  Require(summary.stop_reason == sceneseek::StopReason::kLoopTimeout, "grace expiry is a loop timeout");
  const auto chunks = sink.Count(EventType::kAnswerChunk);
  Require(chunks >= 1 && chunks < 5, "answer is cut once the grace budget is spent");
  RequireSingleTerminal(sink, EventType::kDone);
}

void ScenarioConcurrentTools() {
  sceneseek::tests::Log("scenario: concurrent tools");
  sceneseek::ToolRegistry registry;
  registry.Register(SlowTool("slow_a", std::chrono::milliseconds(80)));
  registry.Register(SlowTool("slow_b", std::chrono::milliseconds(10)));
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  auto decision = sceneseek::tests::CallTool("slow_a", Json::object());
  decision.tool_calls.push_back(sceneseek::ToolCall{"slow_b", Json::object()});
  backend.Queue(decision);
  sceneseek::Decision final_decision{};
  final_decision.final_answer = std::string();
  backend.Queue(final_decision);
  sceneseek::AgentLoop loop(backend, registry, conversations, nullptr);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("both"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kDone && summary.tool_calls == 2, "both tools complete");
  std::vector<std::string> order{};
  for (const auto& event : sink.events()) {
    if (event.type == EventType::kToolResult) {
      order.push_back(event.data["tool"].get<std::string>());
    }
  }
  Require(order == std::vector<std::string>({"slow_a", "slow_b"}), "results reported in call order");
  Require(backend.requests()[1].tool_history.size() == 2, "both observations reach the next decision");
}

void ScenarioBackendFailure() {
  sceneseek::tests::Log("scenario: backend failure");
  sceneseek::tests::CatalogFixture fixture;
  sceneseek::SqliteConversationStore conversations(":memory:");
  ScriptedBackend backend;
  backend.FailDecisions("backend offline");
  sceneseek::AgentLoop loop(backend, fixture.registry(), conversations, nullptr);

  RecordingSink sink;
  const auto summary = loop.Run(MakeInput("anything"), sink, sceneseek::CancellationToken{});
  Require(summary.final_state == LoopState::kFailed && summary.error == "backend offline", "run fails");
  RequireSingleTerminal(sink, EventType::kError);
  Require(sink.events().back().data["message"] == "backend offline", "error event carries the message");
  Require(sink.Count(EventType::kAnswerStart) == 0, "no answer after a failure");
  const auto stored = conversations.GetConversation("conv-1", "artist");
  Require(stored.has_value() && stored->turns.size() == 1, "only the user turn is recorded");
}

}  // namespace

int main() {
  try {
    sceneseek::tests::Log("agent_loop_test: start");
    ScenarioFilterQueryEndToEnd();
    ScenarioUploadedImage();
    ScenarioFallbackAfterFailure();
    ScenarioIterationLimit();
    ScenarioUnknownToolAndDraft();
    ScenarioHistoryWindow();
    ScenarioTransportClosed();
    ScenarioCancelledBeforeStart();
    ScenarioCancelledDuringTools();
    ScenarioToolTimeout();
    ScenarioLoopTimeout();
    ScenarioAnswerGraceExpires();
    ScenarioConcurrentTools();
    ScenarioBackendFailure();
    sceneseek::tests::Log("agent_loop_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sceneseek::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
