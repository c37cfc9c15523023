#include "sceneseek/catalog_tools.hpp"
#include "sceneseek/rule_based_planner.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using sceneseek::Json;
namespace tool_names = sceneseek::tool_names;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

sceneseek::ToolExchange Exchange(const std::string& tool, sceneseek::ToolOutcome outcome) {
  sceneseek::ToolExchange exchange{};
  exchange.call.name = tool;
  exchange.outcome = std::move(outcome);
  exchange.iteration = 1;
  return exchange;
}

Json FileItem(std::int64_t id, const std::string& name, std::int64_t modified_at) {
  return {
      {"id", id},
      {"name", name},
      {"path", "/projects/" + name},
      {"type", "image"},
      {"extension", ".png"},
      {"size", 10},
      {"modified_at", modified_at},
      {"show", nullptr},
      {"thumbnail_path", nullptr},
      {"score", nullptr},
      {"source", "filter"},
      {"width", 3840},
      {"height", 2160},
  };
}

std::string Collect(sceneseek::RuleBasedPlanner& planner, const sceneseek::AnswerRequest& request) {
  std::string text{};
  planner.StreamAnswer(request, [&text](std::string_view chunk) {
    text.append(chunk);
    return true;
  });
  return text;
}

void ScenarioRouting() {
  sceneseek::tests::Log("scenario: routing");
  const sceneseek::RuleBasedPlanner planner;

  const auto image = planner.Route("anything like this?", true);
  Require(image.name == tool_names::kUploadedImageSearch && image.args["limit"] == 10, "images route to upload search");

  const auto fourk = planner.Route("Show me 4K renders", false);
  Require(fourk.name == tool_names::kFilterSearch, "resolution words route to the filter");
  Require(fourk.args["min_resolution_x"] == 3840 && fourk.args["min_resolution_y"] == 2160, "4K bounds");
  Require(!fourk.args.contains("file_type"), "no type word, no type filter");

  const auto exr = planner.Route("8k .exr images", false);
  Require(exr.args["min_resolution_x"] == 7680 && exr.args["extension"] == ".exr" && exr.args["file_type"] == "image",
          "resolution, extension and type combine");

  const auto videos = planner.Route("show me all videos", false);
  Require(videos.name == tool_names::kFilterSearch && videos.args["file_type"] == "video", "bare type word filters");

  const auto described = planner.Route("videos of dragons", false);
  Require(described.name == tool_names::kSemanticSearch, "type word with a description stays semantic");

  const auto stats = planner.Route("How many files per show?", false);
  Require(stats.name == tool_names::kAnalytics && stats.args["group_by"] == "show", "count questions group by show");
  const auto by_ext = planner.Route("count files by extension", false);
  Require(by_ext.args["group_by"] == "extension", "extension grouping");

  const auto details = planner.Route("tell me about file #7", false);
  Require(details.name == tool_names::kFileDetails && details.args["file_id"] == 7, "file ids route to details");

  const auto visual = planner.Route("a scene with a sunset over water", false);
  Require(visual.name == tool_names::kVisualSearch, "visual phrasing routes to visual search");

  const auto semantic = planner.Route("Find forest environment", false);
  Require(semantic.name == tool_names::kSemanticSearch && semantic.args["query"] == "forest environment",
          "request phrases are stripped from semantic queries");
}

void ScenarioDecideFollowUps() {
  sceneseek::tests::Log("scenario: follow-up decisions");
  sceneseek::RuleBasedPlanner planner;
  sceneseek::DecisionRequest request{};
  request.query = "show me";

  const auto first = planner.Decide(request);
  Require(first.tool_calls.size() == 1 && first.tool_calls[0].name == tool_names::kSemanticSearch, "first round routes");

  request.tool_history.push_back(Exchange(tool_names::kSemanticSearch,
                                          sceneseek::ToolOutcome::Failure(sceneseek::ToolFailureKind::kExecutionError,
                                                                          "embedding input is empty")));
  const auto second = planner.Decide(request);
  Require(second.tool_calls.size() == 1 && second.tool_calls[0].name == tool_names::kKeywordSearch,
          "failed round falls back to keyword search");
  Require(second.tool_calls[0].args["query"] == "show me", "fallback searches the raw query");

  request.tool_history.push_back(
      Exchange(tool_names::kKeywordSearch, sceneseek::ToolOutcome::Success({{"count", 0}, {"results", Json::array()}})));
  const auto third = planner.Decide(request);
  Require(third.tool_calls.empty() && third.final_answer.has_value(), "nothing left to try ends deciding");

  sceneseek::DecisionRequest found{};
  found.query = "4k";
  found.tool_history.push_back(Exchange(
      tool_names::kFilterSearch,
      sceneseek::ToolOutcome::Success({{"count", 1}, {"results", Json::array({FileItem(1, "hero.png", 5)})}})));
  const auto done = planner.Decide(found);
  Require(done.tool_calls.empty() && done.final_answer.has_value(), "results end deciding");
}

void ScenarioStreamAnswer() {
  sceneseek::tests::Log("scenario: streamed answer");
  sceneseek::RuleBasedPlanner planner(sceneseek::RuleBasedPlannerOptions{10, 2});

  sceneseek::AnswerRequest request{};
  request.query = "4k renders";
  request.tool_history.push_back(Exchange(
      tool_names::kFilterSearch,
      sceneseek::ToolOutcome::Success(
          {{"count", 3},
           {"results", Json::array({FileItem(1, "old.png", 1), FileItem(2, "new.png", 9), FileItem(3, "mid.png", 5)})}})));
  request.tool_history.push_back(Exchange(
      tool_names::kAnalytics,
      sceneseek::ToolOutcome::Success(
          {{"total_files", 10}, {"group_by", "type"}, {"counts", Json::array({Json{{"key", "image"}, {"count", 3}}})}})));

  const auto text = Collect(planner, request);
  Require(Contains(text, "The catalog holds 10 files (by type: 3 image)."), "statistics described");
  Require(Contains(text, "1. new.png (/projects/new.png)\n2. mid.png"), "newest unscored files listed first");
  Require(!Contains(text, "old.png"), "answer lists only the top items");

  request.best_effort = true;
  Require(Collect(planner, request).rfind("Partial answer", 0) == 0, "best-effort answers say so");

  sceneseek::AnswerRequest empty{};
  empty.query = "submarines";
  Require(Collect(planner, empty) == "I could not find any files matching \"submarines\".", "empty answer");

  int chunks = 0;
  planner.StreamAnswer(request, [&chunks](std::string_view) {
    ++chunks;
    return false;
  });
  Require(chunks == 1, "consumer can stop the stream");
}

void ScenarioChunkWords() {
  sceneseek::tests::Log("scenario: chunking");
  const auto chunks = sceneseek::ChunkWords("Top  matches:\n1. a");
  Require(chunks == std::vector<std::string>({"Top  ", "matches:\n", "1. ", "a"}), "chunks keep trailing whitespace");
  Require(sceneseek::ChunkWords("").empty(), "empty text has no chunks");
}

}  // namespace

int main() {
  try {
    sceneseek::tests::Log("rule_based_planner_test: start");
    ScenarioRouting();
    ScenarioDecideFollowUps();
    ScenarioStreamAnswer();
    ScenarioChunkWords();
    sceneseek::tests::Log("rule_based_planner_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sceneseek::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
