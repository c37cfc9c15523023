#pragma once

#include "sceneseek/catalog_store.hpp"
#include "sceneseek/types.hpp"
#include "sceneseek/vector_index.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sceneseek {

struct SemanticCriteria {
  std::vector<float> embedding;
  int limit = 10;
};

struct VisualCriteria {
  std::vector<float> embedding;
  int limit = 10;
};

struct KeywordCriteria {
  std::string literal;
  int limit = 10;
};

struct FilterCriteria {
  FilterPredicates predicates;
  int limit = 10;
};

using SearchCriteria = std::variant<SemanticCriteria, VisualCriteria, KeywordCriteria, FilterCriteria>;

inline constexpr const char* kSourceSemantic = "semantic";
inline constexpr const char* kSourceVisual = "visual";
inline constexpr const char* kSourceKeyword = "keyword";
inline constexpr const char* kSourceFilter = "filter";

SearchResult ToSearchResult(const CatalogRecord& record, std::optional<double> score, std::string source);

// Read-only search primitives over the catalog. Safe to share across threads
// once the index is built.
class Retriever {
 public:
  Retriever(const CatalogStore& store, const CatalogIndex& index);

  std::vector<SearchResult> Search(const SearchCriteria& criteria) const;

  // Similarity = 1 - cosine distance, clamped to [0, 1].
  std::vector<SearchResult> SemanticSearch(const SemanticCriteria& criteria) const;
  // Ranks across images, videos and blend files together before truncating.
  std::vector<SearchResult> VisualSearch(const VisualCriteria& criteria) const;
  std::vector<SearchResult> KeywordSearch(const KeywordCriteria& criteria) const;
  std::vector<SearchResult> FilterSearch(const FilterCriteria& criteria) const;

  CatalogStats Analytics(CountDimension dimension) const;
  std::optional<CatalogRecord> Details(std::int64_t file_id) const;

 private:
  std::vector<SearchResult> Resolve(const std::vector<VectorHit>& hits, const char* source) const;

  const CatalogStore& store_;
  const CatalogIndex& index_;
};

}  // namespace sceneseek
