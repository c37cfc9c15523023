#include "sceneseek/ranking.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace sceneseek {
namespace {

double ScoreOrZero(const SearchResult& result) {
  if (!result.score.has_value() || std::isnan(*result.score)) {
    return 0.0;
  }
  return *result.score;
}

bool Replaces(const SearchResult& candidate, const SearchResult& kept) {
  if (!candidate.score.has_value()) {
    return false;
  }
  if (!kept.score.has_value()) {
    return true;
  }
  return ScoreOrZero(candidate) > ScoreOrZero(kept);
}

}  // namespace

bool RankBefore(const SearchResult& lhs, const SearchResult& rhs) {
  const bool lhs_scored = lhs.score.has_value();
  const bool rhs_scored = rhs.score.has_value();
  if (lhs_scored != rhs_scored) {
    return lhs_scored;
  }
  if (lhs_scored) {
    const double lhs_score = ScoreOrZero(lhs);
    const double rhs_score = ScoreOrZero(rhs);
    if (lhs_score != rhs_score) {
      return lhs_score > rhs_score;
    }
  }
  if (lhs.modified_at != rhs.modified_at) {
    return lhs.modified_at > rhs.modified_at;
  }
  return lhs.file_id < rhs.file_id;
}

void SortRanked(std::vector<SearchResult>& results) {
  std::sort(results.begin(), results.end(), RankBefore);
}

std::vector<SearchResult> MergeResults(const std::vector<std::vector<SearchResult>>& sequences, std::size_t limit) {
  std::unordered_map<std::int64_t, std::size_t> position{};
  std::vector<SearchResult> merged{};
  for (const auto& sequence : sequences) {
    for (const auto& result : sequence) {
      const auto it = position.find(result.file_id);
      if (it == position.end()) {
        position.emplace(result.file_id, merged.size());
        merged.push_back(result);
        continue;
      }
      if (Replaces(result, merged[it->second])) {
        merged[it->second] = result;
      }
    }
  }
  SortRanked(merged);
  if (merged.size() > limit) {
    merged.resize(limit);
  }
  return merged;
}

}  // namespace sceneseek
