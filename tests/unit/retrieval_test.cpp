#include "sceneseek/retrieval.hpp"

#include "../catalog_fixture.hpp"
#include "../test_logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace sceneseek::tests::fixture_ids;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::vector<std::int64_t> Ids(const std::vector<sceneseek::SearchResult>& results) {
  std::vector<std::int64_t> ids{};
  for (const auto& result : results) {
    ids.push_back(result.file_id);
  }
  return ids;
}

bool RankedByScore(const std::vector<sceneseek::SearchResult>& results) {
  for (std::size_t i = 1; i < results.size(); ++i) {
    if (!results[i - 1].score.has_value() || !results[i].score.has_value()) {
      return false;
    }
    if (*results[i - 1].score < *results[i].score) {
      return false;
    }
  }
  return true;
}

void ScenarioSemanticSearch() {
  sceneseek::tests::Log("scenario: semantic search");
  sceneseek::tests::CatalogFixture fixture;
  const auto& retriever = fixture.retriever();
  const auto query = fixture.embedder().EmbedText("castle turntable render greenwood");
  const auto results = retriever.SemanticSearch({query, 3});
  Require(results.size() == 3, "semantic search must honor the limit");
  Require(RankedByScore(results), "semantic results are ordered by similarity");
  Require(results[0].file_id == kCastleTurntable4k, "closest description must rank first");
  for (const auto& result : results) {
    Require(*result.score >= 0.0 && *result.score <= 1.0, "similarity must be clamped to [0, 1]");
    Require(result.source == sceneseek::kSourceSemantic, "semantic source label");
  }

  const auto everything = retriever.SemanticSearch({query, 50});
  Require(everything.size() == 9, "the failed file is never a semantic candidate");
  Require(retriever.SemanticSearch({query, 0}).empty(), "zero limit yields nothing");
}

void ScenarioVisualSearchSpansTypes() {
  sceneseek::tests::Log("scenario: visual search spans visual types");
  sceneseek::tests::CatalogFixture fixture;
  const auto query = fixture.embedder().EmbedTextForVisualSpace("dragon blend skyfall");
  const auto results = fixture.retriever().VisualSearch({query, 10});
  Require(results.size() == 5, "every visual embedding across images, videos and blends is a candidate");
  Require(RankedByScore(results), "visual results are ranked together before truncating");
  Require(results[0].file_id == kDragonModel, "closest visual description must rank first");
  bool saw_video = false;
  for (const auto& result : results) {
    Require(result.resolution.has_value(), "visual results carry their resolution");
    saw_video = saw_video || result.type == sceneseek::FileType::kVideo;
  }
  Require(saw_video, "videos participate in visual search");

  const auto top = fixture.retriever().VisualSearch({query, 2});
  Require(Ids(top) == std::vector<std::int64_t>({results[0].file_id, results[1].file_id}),
          "truncation keeps the global top results");
}

void ScenarioKeywordAndFilterAreUnscored() {
  sceneseek::tests::Log("scenario: keyword and filter results are unscored");
  sceneseek::tests::CatalogFixture fixture;
  const auto keyword = fixture.retriever().KeywordSearch({"dragon", 10});
  Require(Ids(keyword) == std::vector<std::int64_t>({kDragonModel}), "keyword search finds the literal");
  Require(!keyword[0].score.has_value() && keyword[0].source == sceneseek::kSourceKeyword,
          "keyword results have null score");

  sceneseek::FilterCriteria criteria{};
  criteria.predicates.min_resolution_x = 3840;
  criteria.predicates.min_resolution_y = 2160;
  criteria.limit = 10;
  const auto filtered = fixture.retriever().Search(criteria);
  Require(Ids(filtered) == std::vector<std::int64_t>({kForestEnv8k, kCastleTurntable4k, kHeroRender4k, kDragonModel}),
          "filter search returns every 4K file newest first");
  for (const auto& result : filtered) {
    Require(!result.score.has_value() && result.source == sceneseek::kSourceFilter, "filter results have null score");
    Require(result.resolution->width >= 3840 && result.resolution->height >= 2160, "resolution bound honored");
  }
}

void ScenarioSearchDispatch() {
  sceneseek::tests::Log("scenario: criteria dispatch");
  sceneseek::tests::CatalogFixture fixture;
  const sceneseek::SearchCriteria keyword = sceneseek::KeywordCriteria{"shot_list", 5};
  Require(Ids(fixture.retriever().Search(keyword)) == std::vector<std::int64_t>({kShotList}),
          "keyword criteria dispatch to keyword search");
  const sceneseek::SearchCriteria semantic =
      sceneseek::SemanticCriteria{fixture.embedder().EmbedText("shot list spreadsheet"), 1};
  Require(fixture.retriever().Search(semantic).front().source == sceneseek::kSourceSemantic,
          "semantic criteria dispatch to semantic search");
}

void ScenarioAnalyticsAndDetails() {
  sceneseek::tests::Log("scenario: analytics and details");
  sceneseek::tests::CatalogFixture fixture;
  const auto stats = fixture.retriever().Analytics(sceneseek::CountDimension::kExtension);
  Require(stats.total_files == 10 && stats.dimension == sceneseek::CountDimension::kExtension,
          "analytics counts the whole catalog");
  Require(stats.counts.front().key == ".blend" && stats.counts.front().count == 2, "largest extension group first");

  const auto details = fixture.retriever().Details(kRenderFarmScript);
  Require(details.has_value() && details->file.name == "render_farm.py", "details return the full record");
  Require(!fixture.retriever().Details(4242).has_value(), "unknown id has no details");

  const auto result = sceneseek::ToSearchResult(*details, std::nullopt, "filter");
  Require(!result.resolution.has_value(), "non-visual files carry no resolution");
}

}  // namespace

int main() {
  try {
    sceneseek::tests::Log("retrieval_test: start");
    ScenarioSemanticSearch();
    ScenarioVisualSearchSpansTypes();
    ScenarioKeywordAndFilterAreUnscored();
    ScenarioSearchDispatch();
    ScenarioAnalyticsAndDetails();
    sceneseek::tests::Log("retrieval_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sceneseek::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
