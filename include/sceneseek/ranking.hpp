#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <vector>

namespace sceneseek {

// Scored results first by descending score, then unscored results. Ties break
// by newer modification time, then lower file id.
bool RankBefore(const SearchResult& lhs, const SearchResult& rhs);

void SortRanked(std::vector<SearchResult>& results);

// Deduplicates by file id keeping the higher-scored occurrence (a scored
// occurrence beats an unscored one), ranks, then truncates to `limit`.
std::vector<SearchResult> MergeResults(const std::vector<std::vector<SearchResult>>& sequences, std::size_t limit);

}  // namespace sceneseek
