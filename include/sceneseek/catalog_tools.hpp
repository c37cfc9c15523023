#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sceneseek {

class EmbeddingProvider;
class Retriever;
class ToolRegistry;

namespace tool_names {
inline constexpr const char* kSemanticSearch = "search_by_metadata_embedding";
inline constexpr const char* kVisualSearch = "search_by_visual_embedding";
inline constexpr const char* kUploadedImageSearch = "search_by_uploaded_image";
inline constexpr const char* kKeywordSearch = "keyword_search";
inline constexpr const char* kFilterSearch = "filter_by_metadata";
inline constexpr const char* kAnalytics = "analytics_query";
inline constexpr const char* kFileDetails = "get_file_details";
}  // namespace tool_names

struct CatalogToolOptions {
  int default_limit = 10;
  int max_limit = 50;
};

// Registers every catalog tool from the static tool table. The retriever and
// embedder must outlive the registry.
void RegisterCatalogTools(ToolRegistry& registry,
                          const Retriever& retriever,
                          EmbeddingProvider& embedder,
                          CatalogToolOptions options = {});

// Lower-cased words longer than two characters that are not stop words. Falls
// back to the whole trimmed query when nothing survives.
std::vector<std::string> ExtractKeywords(std::string_view query);

}  // namespace sceneseek
