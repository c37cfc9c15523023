#include "sceneseek/catalog_tools.hpp"

#include "sceneseek/catalog_store.hpp"
#include "sceneseek/embeddings.hpp"
#include "sceneseek/errors.hpp"
#include "sceneseek/ranking.hpp"
#include "sceneseek/retrieval.hpp"
#include "sceneseek/tool_registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sceneseek {
namespace {

constexpr int kMaxResolution = std::numeric_limits<int>::max();

constexpr std::array<std::string_view, 21> kStopWords = {
    "the", "a",   "an",   "and",  "or",   "but",  "in",   "on",   "at",  "to",   "for",
    "show", "me", "find", "get",  "list", "what", "where", "when", "how", "with",
};

struct ToolDeps {
  const Retriever& retriever;
  EmbeddingProvider& embedder;
};

using SchemaBuilder = Json (*)(const CatalogToolOptions& options);
using Handler = Json (*)(const ToolDeps& deps, const Json& args, const ToolContext& context);

struct ToolTableEntry {
  const char* name;
  const char* description;
  const char* signature;
  ToolOutputShape shape;
  SchemaBuilder schema;
  Handler run;
};

Json LimitProperty(const CatalogToolOptions& options) {
  return {
      {"type", "integer"},
      {"minimum", 1},
      {"maximum", options.max_limit},
      {"default", options.default_limit},
      {"description", "Maximum number of results"},
  };
}

Json FileList(const std::vector<SearchResult>& results) {
  Json items = Json::array();
  for (const auto& result : results) {
    items.push_back(ToJson(result));
  }
  return {{"count", results.size()}, {"results", std::move(items)}};
}

Json TextQuerySchema(const char* field, const char* description, const CatalogToolOptions& options) {
  return {
      {"type", "object"},
      {"properties",
       {
           {field, {{"type", "string"}, {"description", description}}},
           {"limit", LimitProperty(options)},
       }},
      {"required", Json::array({field})},
  };
}

Json SemanticSchema(const CatalogToolOptions& options) {
  return TextQuerySchema("query", "Natural language description of the files", options);
}

Json VisualSchema(const CatalogToolOptions& options) {
  return TextQuerySchema("description", "Visual description of the scene or image", options);
}

Json KeywordSchema(const CatalogToolOptions& options) {
  return TextQuerySchema("query", "Words to match in file names, paths or show names", options);
}

Json UploadedImageSchema(const CatalogToolOptions& options) {
  return {
      {"type", "object"},
      {"properties", {{"limit", LimitProperty(options)}}},
  };
}

Json FilterSchema(const CatalogToolOptions& options) {
  Json types = Json::array();
  for (const auto type : {FileType::kImage,
                          FileType::kVideo,
                          FileType::kBlend,
                          FileType::kAudio,
                          FileType::kCode,
                          FileType::kSpreadsheet,
                          FileType::kDocument,
                          FileType::kUnknown}) {
    types.push_back(std::string(FileTypeName(type)));
  }
  return {
      {"type", "object"},
      {"properties",
       {
           {"file_type", {{"type", "string"}, {"enum", std::move(types)}}},
           {"min_resolution_x", {{"type", "integer"}, {"minimum", 1}, {"maximum", kMaxResolution}}},
           {"min_resolution_y", {{"type", "integer"}, {"minimum", 1}, {"maximum", kMaxResolution}}},
           {"extension", {{"type", "string"}}},
           {"show", {{"type", "string"}}},
           {"limit", LimitProperty(options)},
       }},
  };
}

Json AnalyticsSchema(const CatalogToolOptions&) {
  return {
      {"type", "object"},
      {"properties",
       {
           {"group_by", {{"type", "string"}, {"enum", {"type", "show", "extension"}}, {"default", "type"}}},
       }},
  };
}

Json DetailsSchema(const CatalogToolOptions&) {
  return {
      {"type", "object"},
      {"properties", {{"file_id", {{"type", "integer"}, {"minimum", 1}}}}},
      {"required", Json::array({"file_id"})},
  };
}

Json RunSemantic(const ToolDeps& deps, const Json& args, const ToolContext&) {
  SemanticCriteria criteria{};
  criteria.embedding = deps.embedder.EmbedText(args["query"].get<std::string>());
  criteria.limit = args["limit"].get<int>();
  return FileList(deps.retriever.Search(criteria));
}

Json RunVisual(const ToolDeps& deps, const Json& args, const ToolContext&) {
  VisualCriteria criteria{};
  criteria.embedding = deps.embedder.EmbedTextForVisualSpace(args["description"].get<std::string>());
  criteria.limit = args["limit"].get<int>();
  return FileList(deps.retriever.Search(criteria));
}

Json RunUploadedImage(const ToolDeps& deps, const Json& args, const ToolContext& context) {
  if (!context.uploaded_image || context.uploaded_image->empty()) {
    throw ToolExecutionError("no image was uploaded with this request");
  }
  VisualCriteria criteria{};
  criteria.embedding = deps.embedder.EmbedImage(*context.uploaded_image);
  criteria.limit = args["limit"].get<int>();
  return FileList(deps.retriever.Search(criteria));
}

Json RunKeyword(const ToolDeps& deps, const Json& args, const ToolContext&) {
  const int limit = args["limit"].get<int>();
  std::vector<std::vector<SearchResult>> sequences{};
  for (const auto& keyword : ExtractKeywords(args["query"].get<std::string>())) {
    sequences.push_back(deps.retriever.Search(KeywordCriteria{keyword, limit}));
  }
  return FileList(MergeResults(sequences, static_cast<std::size_t>(limit)));
}

Json RunFilter(const ToolDeps& deps, const Json& args, const ToolContext&) {
  FilterCriteria criteria{};
  criteria.limit = args["limit"].get<int>();
  if (args.contains("file_type")) {
    criteria.predicates.file_type = ParseFileType(args["file_type"].get<std::string>());
  }
  if (args.contains("min_resolution_x")) {
    criteria.predicates.min_resolution_x = args["min_resolution_x"].get<int>();
  }
  if (args.contains("min_resolution_y")) {
    criteria.predicates.min_resolution_y = args["min_resolution_y"].get<int>();
  }
  if (args.contains("extension")) {
    criteria.predicates.extension = args["extension"].get<std::string>();
  }
  if (args.contains("show")) {
    criteria.predicates.show = args["show"].get<std::string>();
  }
  return FileList(deps.retriever.Search(criteria));
}

Json RunAnalytics(const ToolDeps& deps, const Json& args, const ToolContext&) {
  const auto dimension = ParseCountDimension(args["group_by"].get<std::string>());
  return ToJson(deps.retriever.Analytics(dimension.value_or(CountDimension::kType)));
}

Json RunDetails(const ToolDeps& deps, const Json& args, const ToolContext&) {
  const auto file_id = args["file_id"].get<std::int64_t>();
  const auto record = deps.retriever.Details(file_id);
  if (!record.has_value()) {
    throw NotFoundError("file " + std::to_string(file_id) + " does not exist");
  }
  return RecordToJson(*record);
}

const std::array<ToolTableEntry, 7> kToolTable = {{
    {tool_names::kSemanticSearch,
     "Semantic search over file metadata (names, paths, shows). Use for general descriptive queries.",
     "search_by_metadata_embedding(query: string, limit?: int) -> file_list",
     ToolOutputShape::kFileList,
     SemanticSchema,
     RunSemantic},
    {tool_names::kVisualSearch,
     "Search visual content (images, videos, Blender scenes) by a text description of how it looks.",
     "search_by_visual_embedding(description: string, limit?: int) -> file_list",
     ToolOutputShape::kFileList,
     VisualSchema,
     RunVisual},
    {tool_names::kUploadedImageSearch,
     "Find files visually similar to the image uploaded with the request.",
     "search_by_uploaded_image(limit?: int) -> file_list",
     ToolOutputShape::kFileList,
     UploadedImageSchema,
     RunUploadedImage},
    {tool_names::kKeywordSearch,
     "Literal keyword match on file names, paths and show names. Always available as a fallback.",
     "keyword_search(query: string, limit?: int) -> file_list",
     ToolOutputShape::kFileList,
     KeywordSchema,
     RunKeyword},
    {tool_names::kFilterSearch,
     "Exact filters: file type, minimum resolution, extension and show. Newest first.",
     "filter_by_metadata(file_type?: string, min_resolution_x?: int, min_resolution_y?: int, extension?: string, "
     "show?: string, limit?: int) -> file_list",
     ToolOutputShape::kFileList,
     FilterSchema,
     RunFilter},
    {tool_names::kAnalytics,
     "Count catalog files grouped by type, show or extension.",
     "analytics_query(group_by?: \"type\"|\"show\"|\"extension\") -> statistics",
     ToolOutputShape::kStatistics,
     AnalyticsSchema,
     RunAnalytics},
    {tool_names::kFileDetails,
     "Full metadata for one file id.",
     "get_file_details(file_id: int) -> file_details",
     ToolOutputShape::kFileDetails,
     DetailsSchema,
     RunDetails},
}};

std::string StripPunctuation(std::string_view word) {
  std::size_t begin = 0;
  std::size_t end = word.size();
  while (begin < end && std::ispunct(static_cast<unsigned char>(word[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::ispunct(static_cast<unsigned char>(word[end - 1])) != 0) {
    --end;
  }
  return std::string(word.substr(begin, end - begin));
}

}  // namespace

void RegisterCatalogTools(ToolRegistry& registry,
                          const Retriever& retriever,
                          EmbeddingProvider& embedder,
                          CatalogToolOptions options) {
  const ToolDeps deps{retriever, embedder};
  for (const auto& entry : kToolTable) {
    const Handler run = entry.run;
    registry.Register(ToolDefinition{
        .name = entry.name,
        .description = entry.description,
        .signature = entry.signature,
        .input_schema = entry.schema(options),
        .output_shape = entry.shape,
        .execute = [deps, run](const Json& args, const ToolContext& context) { return run(deps, args, context); },
    });
  }
}

std::vector<std::string> ExtractKeywords(std::string_view query) {
  std::vector<std::string> keywords{};
  std::unordered_set<std::string> seen{};
  std::string word{};
  auto flush = [&]() {
    auto cleaned = StripPunctuation(word);
    word.clear();
    if (cleaned.size() <= 2) {
      return;
    }
    if (std::find(kStopWords.begin(), kStopWords.end(), cleaned) != kStopWords.end()) {
      return;
    }
    if (seen.insert(cleaned).second) {
      keywords.push_back(std::move(cleaned));
    }
  };
  for (const unsigned char ch : query) {
    if (std::isspace(ch) != 0) {
      flush();
      continue;
    }
    word.push_back(static_cast<char>(std::tolower(ch)));
  }
  flush();

  if (keywords.empty()) {
    std::size_t begin = 0;
    std::size_t end = query.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(query[begin])) != 0) {
      ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(query[end - 1])) != 0) {
      --end;
    }
    if (end > begin) {
      keywords.emplace_back(query.substr(begin, end - begin));
    }
  }
  return keywords;
}

}  // namespace sceneseek
