#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sceneseek {

using Json = nlohmann::json;

inline constexpr std::size_t kTextEmbeddingDims = 384;
inline constexpr std::size_t kVisualEmbeddingDims = 512;

enum class FileType {
  kImage,
  kVideo,
  kBlend,
  kAudio,
  kCode,
  kSpreadsheet,
  kDocument,
  kUnknown,
};

std::string_view FileTypeName(FileType type);
std::optional<FileType> ParseFileType(std::string_view name);
bool HasVisualExtension(FileType type);

// A scanned catalog entry. A file that failed extraction carries `error` and
// never an embedding.
struct CatalogFile {
  std::int64_t id = 0;
  std::string name;
  std::string path;
  FileType type = FileType::kUnknown;
  std::string extension;
  std::int64_t size = 0;
  std::int64_t created_at = 0;
  std::int64_t modified_at = 0;
  std::int64_t scanned_at = 0;
  std::optional<std::string> show;
  std::optional<std::vector<float>> embedding;
  std::optional<std::string> error;
};

struct Resolution {
  int width = 0;
  int height = 0;
};

struct ImageInfo {
  Resolution resolution{};
  std::optional<std::string> thumbnail_path;
  std::optional<std::vector<float>> visual_embedding;
  std::optional<std::string> color_mode;
};

struct VideoInfo {
  Resolution resolution{};
  std::optional<std::string> thumbnail_path;
  std::optional<std::vector<float>> visual_embedding;
  double duration_seconds = 0.0;
  double fps = 0.0;
  std::optional<std::string> codec;
};

struct BlendInfo {
  Resolution resolution{};
  std::optional<std::string> thumbnail_path;
  std::optional<std::vector<float>> visual_embedding;
  std::optional<std::string> render_engine;
  int frame_count = 0;
};

struct AudioInfo {
  double duration_seconds = 0.0;
  int bitrate = 0;
  int channels = 0;
  int sample_rate = 0;
};

struct CodeInfo {
  std::string language;
  int line_count = 0;
};

struct SpreadsheetInfo {
  int sheet_count = 0;
  int row_count = 0;
};

struct DocumentInfo {
  int page_count = 0;
  int word_count = 0;
};

using TypedExtension =
    std::variant<ImageInfo, VideoInfo, BlendInfo, AudioInfo, CodeInfo, SpreadsheetInfo, DocumentInfo>;

FileType ExtensionFileType(const TypedExtension& extension);
Json ExtensionToJson(const TypedExtension& extension, bool include_embeddings = true);
// Throws std::invalid_argument when `kind` is missing or unknown.
TypedExtension ExtensionFromJson(const Json& value);

struct CatalogRecord {
  CatalogFile file;
  std::optional<TypedExtension> extension;
};

Json FileToJson(const CatalogFile& file, bool include_embeddings = true);
CatalogFile FileFromJson(const Json& value);
// Detail view: embeddings are reported as presence flags only.
Json RecordToJson(const CatalogRecord& record);

// Transient, never persisted. `score` is null for keyword/filter matches.
struct SearchResult {
  std::int64_t file_id = 0;
  std::string name;
  std::string path;
  FileType type = FileType::kUnknown;
  std::string extension;
  std::int64_t size = 0;
  std::int64_t modified_at = 0;
  std::optional<std::string> show;
  std::optional<Resolution> resolution;
  std::optional<std::string> thumbnail_path;
  std::optional<double> score;
  std::string source;
};

Json ToJson(const SearchResult& result);
SearchResult SearchResultFromJson(const Json& value);

struct ToolCall {
  std::string name;
  Json args = Json::object();
  std::optional<Json> result;
  std::optional<std::string> failure;
};

Json ToJson(const ToolCall& call);
ToolCall ToolCallFromJson(const Json& value);

enum class TurnKind {
  kUser,
  kAssistant,
  kToolCall,
};

std::string_view TurnKindName(TurnKind kind);
std::optional<TurnKind> ParseTurnKind(std::string_view name);

struct Turn {
  TurnKind kind = TurnKind::kUser;
  std::string content;
  std::int64_t timestamp_ms = 0;
  std::vector<ToolCall> tool_calls;
};

bool operator==(const ToolCall& lhs, const ToolCall& rhs);
bool operator==(const Turn& lhs, const Turn& rhs);

Json ToJson(const Turn& turn);

struct Conversation {
  std::string conversation_id;
  std::string user_id;
  std::string title;
  std::vector<Turn> turns;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
};

struct ConversationSummary {
  std::string conversation_id;
  std::string user_id;
  std::string title;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
  std::size_t message_count = 0;
};

Json ToJson(const Conversation& conversation);
Json ToJson(const ConversationSummary& summary);

}  // namespace sceneseek
