#include "sceneseek/types.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace sceneseek {
namespace {

struct FileTypeEntry {
  FileType type;
  std::string_view name;
};

constexpr std::array<FileTypeEntry, 8> kFileTypes = {{
    {FileType::kImage, "image"},
    {FileType::kVideo, "video"},
    {FileType::kBlend, "blend"},
    {FileType::kAudio, "audio"},
    {FileType::kCode, "code"},
    {FileType::kSpreadsheet, "spreadsheet"},
    {FileType::kDocument, "document"},
    {FileType::kUnknown, "unknown"},
}};

template <typename T>
Json OptionalToJson(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return Json(*value);
}

template <typename T>
std::optional<T> OptionalFromJson(const Json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename T>
T ValueOr(const Json& object, const char* key, T fallback) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

void PutVisualFields(Json& out,
                     const Resolution& resolution,
                     const std::optional<std::string>& thumbnail_path,
                     const std::optional<std::vector<float>>& visual_embedding,
                     bool include_embeddings) {
  out["width"] = resolution.width;
  out["height"] = resolution.height;
  out["thumbnail_path"] = OptionalToJson(thumbnail_path);
  if (include_embeddings) {
    if (visual_embedding.has_value()) {
      out["visual_embedding"] = *visual_embedding;
    }
  } else {
    out["has_visual_embedding"] = visual_embedding.has_value();
  }
}

template <typename Info>
void ReadVisualFields(const Json& value, Info& info) {
  info.resolution.width = ValueOr<int>(value, "width", 0);
  info.resolution.height = ValueOr<int>(value, "height", 0);
  info.thumbnail_path = OptionalFromJson<std::string>(value, "thumbnail_path");
  info.visual_embedding = OptionalFromJson<std::vector<float>>(value, "visual_embedding");
}

}  // namespace

std::string_view FileTypeName(FileType type) {
  for (const auto& entry : kFileTypes) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<FileType> ParseFileType(std::string_view name) {
  for (const auto& entry : kFileTypes) {
    if (entry.name == name) {
      return entry.type;
    }
  }
  return std::nullopt;
}

bool HasVisualExtension(FileType type) {
  return type == FileType::kImage || type == FileType::kVideo || type == FileType::kBlend;
}

FileType ExtensionFileType(const TypedExtension& extension) {
  return std::visit(
      [](const auto& info) -> FileType {
        using T = std::decay_t<decltype(info)>;
        if constexpr (std::is_same_v<T, ImageInfo>) {
          return FileType::kImage;
        } else if constexpr (std::is_same_v<T, VideoInfo>) {
          return FileType::kVideo;
        } else if constexpr (std::is_same_v<T, BlendInfo>) {
          return FileType::kBlend;
        } else if constexpr (std::is_same_v<T, AudioInfo>) {
          return FileType::kAudio;
        } else if constexpr (std::is_same_v<T, CodeInfo>) {
          return FileType::kCode;
        } else if constexpr (std::is_same_v<T, SpreadsheetInfo>) {
          return FileType::kSpreadsheet;
        } else {
          return FileType::kDocument;
        }
      },
      extension);
}

Json ExtensionToJson(const TypedExtension& extension, bool include_embeddings) {
  Json out = Json::object();
  out["kind"] = std::string(FileTypeName(ExtensionFileType(extension)));
  std::visit(
      [&out, include_embeddings](const auto& info) {
        using T = std::decay_t<decltype(info)>;
        if constexpr (std::is_same_v<T, ImageInfo>) {
          PutVisualFields(out, info.resolution, info.thumbnail_path, info.visual_embedding, include_embeddings);
          out["color_mode"] = OptionalToJson(info.color_mode);
        } else if constexpr (std::is_same_v<T, VideoInfo>) {
          PutVisualFields(out, info.resolution, info.thumbnail_path, info.visual_embedding, include_embeddings);
          out["duration_seconds"] = info.duration_seconds;
          out["fps"] = info.fps;
          out["codec"] = OptionalToJson(info.codec);
        } else if constexpr (std::is_same_v<T, BlendInfo>) {
          PutVisualFields(out, info.resolution, info.thumbnail_path, info.visual_embedding, include_embeddings);
          out["render_engine"] = OptionalToJson(info.render_engine);
          out["frame_count"] = info.frame_count;
        } else if constexpr (std::is_same_v<T, AudioInfo>) {
          out["duration_seconds"] = info.duration_seconds;
          out["bitrate"] = info.bitrate;
          out["channels"] = info.channels;
          out["sample_rate"] = info.sample_rate;
        } else if constexpr (std::is_same_v<T, CodeInfo>) {
          out["language"] = info.language;
          out["line_count"] = info.line_count;
        } else if constexpr (std::is_same_v<T, SpreadsheetInfo>) {
          out["sheet_count"] = info.sheet_count;
          out["row_count"] = info.row_count;
        } else {
          out["page_count"] = info.page_count;
          out["word_count"] = info.word_count;
        }
      },
      extension);
  return out;
}

TypedExtension ExtensionFromJson(const Json& value) {
  if (!value.is_object() || !value.contains("kind") || !value["kind"].is_string()) {
    throw std::invalid_argument("extension requires a string 'kind'");
  }
  const auto kind = ParseFileType(value["kind"].get<std::string>());
  if (!kind.has_value()) {
    throw std::invalid_argument("unknown extension kind: " + value["kind"].get<std::string>());
  }
  switch (*kind) {
    case FileType::kImage: {
      ImageInfo info{};
      ReadVisualFields(value, info);
      info.color_mode = OptionalFromJson<std::string>(value, "color_mode");
      return info;
    }
    case FileType::kVideo: {
      VideoInfo info{};
      ReadVisualFields(value, info);
      info.duration_seconds = ValueOr<double>(value, "duration_seconds", 0.0);
      info.fps = ValueOr<double>(value, "fps", 0.0);
      info.codec = OptionalFromJson<std::string>(value, "codec");
      return info;
    }
    case FileType::kBlend: {
      BlendInfo info{};
      ReadVisualFields(value, info);
      info.render_engine = OptionalFromJson<std::string>(value, "render_engine");
      info.frame_count = ValueOr<int>(value, "frame_count", 0);
      return info;
    }
    case FileType::kAudio:
      return AudioInfo{
          .duration_seconds = ValueOr<double>(value, "duration_seconds", 0.0),
          .bitrate = ValueOr<int>(value, "bitrate", 0),
          .channels = ValueOr<int>(value, "channels", 0),
          .sample_rate = ValueOr<int>(value, "sample_rate", 0),
      };
    case FileType::kCode:
      return CodeInfo{
          .language = ValueOr<std::string>(value, "language", ""),
          .line_count = ValueOr<int>(value, "line_count", 0),
      };
    case FileType::kSpreadsheet:
      return SpreadsheetInfo{
          .sheet_count = ValueOr<int>(value, "sheet_count", 0),
          .row_count = ValueOr<int>(value, "row_count", 0),
      };
    case FileType::kDocument:
      return DocumentInfo{
          .page_count = ValueOr<int>(value, "page_count", 0),
          .word_count = ValueOr<int>(value, "word_count", 0),
      };
    case FileType::kUnknown:
      break;
  }
  throw std::invalid_argument("files of type 'unknown' carry no extension");
}

Json FileToJson(const CatalogFile& file, bool include_embeddings) {
  Json out = {
      {"id", file.id},
      {"name", file.name},
      {"path", file.path},
      {"type", std::string(FileTypeName(file.type))},
      {"extension", file.extension},
      {"size", file.size},
      {"created_at", file.created_at},
      {"modified_at", file.modified_at},
      {"scanned_at", file.scanned_at},
      {"show", OptionalToJson(file.show)},
      {"error", OptionalToJson(file.error)},
  };
  if (include_embeddings) {
    if (file.embedding.has_value()) {
      out["embedding"] = *file.embedding;
    }
  } else {
    out["has_embedding"] = file.embedding.has_value();
  }
  return out;
}

CatalogFile FileFromJson(const Json& value) {
  if (!value.is_object()) {
    throw std::invalid_argument("file entry must be an object");
  }
  CatalogFile file{};
  file.id = value.at("id").get<std::int64_t>();
  file.name = value.at("name").get<std::string>();
  file.path = ValueOr<std::string>(value, "path", file.name);
  const auto type_name = ValueOr<std::string>(value, "type", "unknown");
  const auto type = ParseFileType(type_name);
  if (!type.has_value()) {
    throw std::invalid_argument("unknown file type: " + type_name);
  }
  file.type = *type;
  file.extension = ValueOr<std::string>(value, "extension", "");
  file.size = ValueOr<std::int64_t>(value, "size", 0);
  file.created_at = ValueOr<std::int64_t>(value, "created_at", 0);
  file.modified_at = ValueOr<std::int64_t>(value, "modified_at", file.created_at);
  file.scanned_at = ValueOr<std::int64_t>(value, "scanned_at", file.modified_at);
  file.show = OptionalFromJson<std::string>(value, "show");
  file.embedding = OptionalFromJson<std::vector<float>>(value, "embedding");
  file.error = OptionalFromJson<std::string>(value, "error");
  return file;
}

Json RecordToJson(const CatalogRecord& record) {
  Json out = FileToJson(record.file, false);
  out["details"] = record.extension.has_value() ? ExtensionToJson(*record.extension, false) : Json(nullptr);
  return out;
}

Json ToJson(const SearchResult& result) {
  Json out = {
      {"id", result.file_id},
      {"name", result.name},
      {"path", result.path},
      {"type", std::string(FileTypeName(result.type))},
      {"extension", result.extension},
      {"size", result.size},
      {"modified_at", result.modified_at},
      {"show", OptionalToJson(result.show)},
      {"thumbnail_path", OptionalToJson(result.thumbnail_path)},
      {"score", OptionalToJson(result.score)},
      {"source", result.source},
  };
  if (result.resolution.has_value()) {
    out["width"] = result.resolution->width;
    out["height"] = result.resolution->height;
  } else {
    out["width"] = nullptr;
    out["height"] = nullptr;
  }
  return out;
}

SearchResult SearchResultFromJson(const Json& value) {
  SearchResult result{};
  result.file_id = value.at("id").get<std::int64_t>();
  result.name = ValueOr<std::string>(value, "name", "");
  result.path = ValueOr<std::string>(value, "path", "");
  result.type = ParseFileType(ValueOr<std::string>(value, "type", "unknown")).value_or(FileType::kUnknown);
  result.extension = ValueOr<std::string>(value, "extension", "");
  result.size = ValueOr<std::int64_t>(value, "size", 0);
  result.modified_at = ValueOr<std::int64_t>(value, "modified_at", 0);
  result.show = OptionalFromJson<std::string>(value, "show");
  result.thumbnail_path = OptionalFromJson<std::string>(value, "thumbnail_path");
  result.score = OptionalFromJson<double>(value, "score");
  result.source = ValueOr<std::string>(value, "source", "");
  const auto width = OptionalFromJson<int>(value, "width");
  const auto height = OptionalFromJson<int>(value, "height");
  if (width.has_value() && height.has_value()) {
    result.resolution = Resolution{*width, *height};
  }
  return result;
}

Json ToJson(const ToolCall& call) {
  Json out = {{"name", call.name}, {"args", call.args}};
  if (call.result.has_value()) {
    out["result"] = *call.result;
  }
  if (call.failure.has_value()) {
    out["failure"] = *call.failure;
  }
  return out;
}

ToolCall ToolCallFromJson(const Json& value) {
  ToolCall call{};
  call.name = value.at("name").get<std::string>();
  call.args = value.contains("args") ? value["args"] : Json::object();
  if (value.contains("result")) {
    call.result = value["result"];
  }
  call.failure = OptionalFromJson<std::string>(value, "failure");
  return call;
}

std::string_view TurnKindName(TurnKind kind) {
  switch (kind) {
    case TurnKind::kUser:
      return "user";
    case TurnKind::kAssistant:
      return "assistant";
    case TurnKind::kToolCall:
      return "tool_call";
  }
  return "user";
}

std::optional<TurnKind> ParseTurnKind(std::string_view name) {
  if (name == "user") {
    return TurnKind::kUser;
  }
  if (name == "assistant") {
    return TurnKind::kAssistant;
  }
  if (name == "tool_call") {
    return TurnKind::kToolCall;
  }
  return std::nullopt;
}

bool operator==(const ToolCall& lhs, const ToolCall& rhs) {
  return lhs.name == rhs.name && lhs.args == rhs.args && lhs.result == rhs.result && lhs.failure == rhs.failure;
}

bool operator==(const Turn& lhs, const Turn& rhs) {
  return lhs.kind == rhs.kind && lhs.content == rhs.content && lhs.timestamp_ms == rhs.timestamp_ms &&
         lhs.tool_calls == rhs.tool_calls;
}

Json ToJson(const Turn& turn) {
  Json calls = Json::array();
  for (const auto& call : turn.tool_calls) {
    calls.push_back(ToJson(call));
  }
  return {
      {"role", std::string(TurnKindName(turn.kind))},
      {"content", turn.content},
      {"timestamp_ms", turn.timestamp_ms},
      {"tool_calls", std::move(calls)},
  };
}

Json ToJson(const Conversation& conversation) {
  Json turns = Json::array();
  for (const auto& turn : conversation.turns) {
    turns.push_back(ToJson(turn));
  }
  return {
      {"conversation_id", conversation.conversation_id},
      {"user_id", conversation.user_id},
      {"title", conversation.title},
      {"created_at_ms", conversation.created_at_ms},
      {"updated_at_ms", conversation.updated_at_ms},
      {"message_count", conversation.turns.size()},
      {"messages", std::move(turns)},
  };
}

Json ToJson(const ConversationSummary& summary) {
  return {
      {"conversation_id", summary.conversation_id},
      {"user_id", summary.user_id},
      {"title", summary.title},
      {"created_at_ms", summary.created_at_ms},
      {"updated_at_ms", summary.updated_at_ms},
      {"message_count", summary.message_count},
  };
}

}  // namespace sceneseek
