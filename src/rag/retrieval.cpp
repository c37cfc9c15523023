#include "sceneseek/retrieval.hpp"

#include "sceneseek/ranking.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sceneseek {
namespace {

double ClampSimilarity(float similarity) {
  return std::clamp(static_cast<double>(similarity), 0.0, 1.0);
}

std::size_t LimitOf(int limit) {
  return limit > 0 ? static_cast<std::size_t>(limit) : 0;
}

void ApplyVisualFields(SearchResult& result,
                       const Resolution& resolution,
                       const std::optional<std::string>& thumbnail_path) {
  result.resolution = resolution;
  result.thumbnail_path = thumbnail_path;
}

}  // namespace

SearchResult ToSearchResult(const CatalogRecord& record, std::optional<double> score, std::string source) {
  SearchResult result{};
  result.file_id = record.file.id;
  result.name = record.file.name;
  result.path = record.file.path;
  result.type = record.file.type;
  result.extension = record.file.extension;
  result.size = record.file.size;
  result.modified_at = record.file.modified_at;
  result.show = record.file.show;
  result.score = score;
  result.source = std::move(source);
  if (record.extension.has_value()) {
    std::visit(
        [&result](const auto& info) {
          using T = std::decay_t<decltype(info)>;
          if constexpr (std::is_same_v<T, ImageInfo> || std::is_same_v<T, VideoInfo> ||
                        std::is_same_v<T, BlendInfo>) {
            ApplyVisualFields(result, info.resolution, info.thumbnail_path);
          }
        },
        *record.extension);
  }
  return result;
}

Retriever::Retriever(const CatalogStore& store, const CatalogIndex& index) : store_(store), index_(index) {}

std::vector<SearchResult> Retriever::Search(const SearchCriteria& criteria) const {
  return std::visit(
      [this](const auto& c) -> std::vector<SearchResult> {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, SemanticCriteria>) {
          return SemanticSearch(c);
        } else if constexpr (std::is_same_v<T, VisualCriteria>) {
          return VisualSearch(c);
        } else if constexpr (std::is_same_v<T, KeywordCriteria>) {
          return KeywordSearch(c);
        } else {
          return FilterSearch(c);
        }
      },
      criteria);
}

std::vector<SearchResult> Retriever::Resolve(const std::vector<VectorHit>& hits, const char* source) const {
  std::vector<std::int64_t> ids{};
  ids.reserve(hits.size());
  for (const auto& hit : hits) {
    ids.push_back(hit.id);
  }
  std::unordered_map<std::int64_t, float> similarity{};
  for (const auto& hit : hits) {
    similarity.emplace(hit.id, hit.similarity);
  }

  std::vector<SearchResult> results{};
  results.reserve(hits.size());
  for (const auto& record : store_.GetRecords(ids)) {
    results.push_back(ToSearchResult(record, ClampSimilarity(similarity.at(record.file.id)), source));
  }
  return results;
}

std::vector<SearchResult> Retriever::SemanticSearch(const SemanticCriteria& criteria) const {
  const auto limit = LimitOf(criteria.limit);
  const auto& index = index_.text();
  if (limit == 0 || index.size() == 0) {
    return {};
  }
  // Full candidate list so the recency tie-break can see every equal score.
  auto results = Resolve(index.Search(criteria.embedding, index.size()), kSourceSemantic);
  SortRanked(results);
  if (results.size() > limit) {
    results.resize(limit);
  }
  spdlog::debug("semantic search: {} results", results.size());
  return results;
}

std::vector<SearchResult> Retriever::VisualSearch(const VisualCriteria& criteria) const {
  const auto limit = LimitOf(criteria.limit);
  if (limit == 0) {
    return {};
  }
  std::vector<std::vector<SearchResult>> per_type{};
  for (const auto type : {FileType::kImage, FileType::kVideo, FileType::kBlend}) {
    const auto& index = index_.visual(type);
    if (index.size() == 0) {
      continue;
    }
    per_type.push_back(Resolve(index.Search(criteria.embedding, index.size()), kSourceVisual));
  }
  auto results = MergeResults(per_type, limit);
  spdlog::debug("visual search: {} results", results.size());
  return results;
}

std::vector<SearchResult> Retriever::KeywordSearch(const KeywordCriteria& criteria) const {
  std::vector<SearchResult> results{};
  for (const auto& record : store_.KeywordMatches(criteria.literal, criteria.limit)) {
    results.push_back(ToSearchResult(record, std::nullopt, kSourceKeyword));
  }
  spdlog::debug("keyword search '{}': {} results", criteria.literal, results.size());
  return results;
}

std::vector<SearchResult> Retriever::FilterSearch(const FilterCriteria& criteria) const {
  std::vector<SearchResult> results{};
  for (const auto& record : store_.FilterMatches(criteria.predicates, criteria.limit)) {
    results.push_back(ToSearchResult(record, std::nullopt, kSourceFilter));
  }
  spdlog::debug("filter search: {} results", results.size());
  return results;
}

CatalogStats Retriever::Analytics(CountDimension dimension) const {
  return store_.CountBy(dimension);
}

std::optional<CatalogRecord> Retriever::Details(std::int64_t file_id) const {
  return store_.GetRecord(file_id);
}

}  // namespace sceneseek
