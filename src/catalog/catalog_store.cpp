#include "sceneseek/catalog_store.hpp"

#include "../core/sqlite_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sceneseek {
namespace {

using sqlite::Statement;

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS files (
  id INTEGER PRIMARY KEY,
  name TEXT NOT NULL,
  path TEXT NOT NULL,
  extension TEXT NOT NULL DEFAULT '',
  type TEXT NOT NULL,
  size INTEGER NOT NULL DEFAULT 0,
  created_at INTEGER NOT NULL DEFAULT 0,
  modified_at INTEGER NOT NULL DEFAULT 0,
  scanned_at INTEGER NOT NULL DEFAULT 0,
  show TEXT,
  embedding BLOB,
  error TEXT,
  CHECK (embedding IS NULL OR error IS NULL)
);
CREATE INDEX IF NOT EXISTS idx_files_modified ON files(modified_at DESC, id);
CREATE INDEX IF NOT EXISTS idx_files_type ON files(type);
CREATE INDEX IF NOT EXISTS idx_files_show ON files(show);
CREATE TABLE IF NOT EXISTS images (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  width INTEGER NOT NULL DEFAULT 0,
  height INTEGER NOT NULL DEFAULT 0,
  thumbnail_path TEXT,
  visual_embedding BLOB,
  color_mode TEXT
);
CREATE TABLE IF NOT EXISTS videos (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  width INTEGER NOT NULL DEFAULT 0,
  height INTEGER NOT NULL DEFAULT 0,
  thumbnail_path TEXT,
  visual_embedding BLOB,
  duration_seconds REAL NOT NULL DEFAULT 0,
  fps REAL NOT NULL DEFAULT 0,
  codec TEXT
);
CREATE TABLE IF NOT EXISTS blend_files (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  width INTEGER NOT NULL DEFAULT 0,
  height INTEGER NOT NULL DEFAULT 0,
  thumbnail_path TEXT,
  visual_embedding BLOB,
  render_engine TEXT,
  frame_count INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS audio_files (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  duration_seconds REAL NOT NULL DEFAULT 0,
  bitrate INTEGER NOT NULL DEFAULT 0,
  channels INTEGER NOT NULL DEFAULT 0,
  sample_rate INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS code_files (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  language TEXT NOT NULL DEFAULT '',
  line_count INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS spreadsheets (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  sheet_count INTEGER NOT NULL DEFAULT 0,
  row_count INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS documents (
  file_id INTEGER PRIMARY KEY REFERENCES files(id) ON DELETE CASCADE,
  page_count INTEGER NOT NULL DEFAULT 0,
  word_count INTEGER NOT NULL DEFAULT 0
);
)sql";

constexpr const char* kFileColumns =
    "f.id, f.name, f.path, f.extension, f.type, f.size, f.created_at, f.modified_at, f.scanned_at, f.show, "
    "f.embedding, f.error";

const char* VisualTable(FileType type) {
  switch (type) {
    case FileType::kImage:
      return "images";
    case FileType::kVideo:
      return "videos";
    case FileType::kBlend:
      return "blend_files";
    default:
      break;
  }
  throw std::invalid_argument("file type has no visual table: " + std::string(FileTypeName(type)));
}

CatalogFile ReadFile(const Statement& stmt) {
  CatalogFile file{};
  file.id = stmt.ColumnInt64(0);
  file.name = stmt.ColumnText(1);
  file.path = stmt.ColumnText(2);
  file.extension = stmt.ColumnText(3);
  file.type = ParseFileType(stmt.ColumnText(4)).value_or(FileType::kUnknown);
  file.size = stmt.ColumnInt64(5);
  file.created_at = stmt.ColumnInt64(6);
  file.modified_at = stmt.ColumnInt64(7);
  file.scanned_at = stmt.ColumnInt64(8);
  file.show = stmt.ColumnOptionalText(9);
  file.embedding = stmt.ColumnVector(10);
  file.error = stmt.ColumnOptionalText(11);
  return file;
}

std::vector<CatalogFile> ReadFiles(Statement& stmt) {
  std::vector<CatalogFile> files{};
  while (stmt.Step()) {
    files.push_back(ReadFile(stmt));
  }
  return files;
}

Resolution ReadResolution(const Statement& stmt) {
  return Resolution{static_cast<int>(stmt.ColumnInt64(0)), static_cast<int>(stmt.ColumnInt64(1))};
}

std::optional<TypedExtension> LoadExtension(sqlite3* db, std::int64_t file_id, FileType type) {
  switch (type) {
    case FileType::kImage: {
      Statement stmt(db,
                     "SELECT width, height, thumbnail_path, visual_embedding, color_mode FROM images WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return ImageInfo{ReadResolution(stmt), stmt.ColumnOptionalText(2), stmt.ColumnVector(3), stmt.ColumnOptionalText(4)};
    }
    case FileType::kVideo: {
      Statement stmt(db,
                     "SELECT width, height, thumbnail_path, visual_embedding, duration_seconds, fps, codec "
                     "FROM videos WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return VideoInfo{ReadResolution(stmt),
                       stmt.ColumnOptionalText(2),
                       stmt.ColumnVector(3),
                       stmt.ColumnDouble(4),
                       stmt.ColumnDouble(5),
                       stmt.ColumnOptionalText(6)};
    }
    case FileType::kBlend: {
      Statement stmt(db,
                     "SELECT width, height, thumbnail_path, visual_embedding, render_engine, frame_count "
                     "FROM blend_files WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return BlendInfo{ReadResolution(stmt),
                       stmt.ColumnOptionalText(2),
                       stmt.ColumnVector(3),
                       stmt.ColumnOptionalText(4),
                       static_cast<int>(stmt.ColumnInt64(5))};
    }
    case FileType::kAudio: {
      Statement stmt(db, "SELECT duration_seconds, bitrate, channels, sample_rate FROM audio_files WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return AudioInfo{stmt.ColumnDouble(0),
                       static_cast<int>(stmt.ColumnInt64(1)),
                       static_cast<int>(stmt.ColumnInt64(2)),
                       static_cast<int>(stmt.ColumnInt64(3))};
    }
    case FileType::kCode: {
      Statement stmt(db, "SELECT language, line_count FROM code_files WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return CodeInfo{stmt.ColumnText(0), static_cast<int>(stmt.ColumnInt64(1))};
    }
    case FileType::kSpreadsheet: {
      Statement stmt(db, "SELECT sheet_count, row_count FROM spreadsheets WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return SpreadsheetInfo{static_cast<int>(stmt.ColumnInt64(0)), static_cast<int>(stmt.ColumnInt64(1))};
    }
    case FileType::kDocument: {
      Statement stmt(db, "SELECT page_count, word_count FROM documents WHERE file_id = ?1;");
      stmt.BindInt64(1, file_id);
      if (!stmt.Step()) {
        return std::nullopt;
      }
      return DocumentInfo{static_cast<int>(stmt.ColumnInt64(0)), static_cast<int>(stmt.ColumnInt64(1))};
    }
    case FileType::kUnknown:
      break;
  }
  return std::nullopt;
}

void RequireVisualDims(const std::optional<std::vector<float>>& embedding) {
  if (embedding.has_value() && embedding->size() != kVisualEmbeddingDims) {
    throw std::invalid_argument("visual embedding must have " + std::to_string(kVisualEmbeddingDims) + " dimensions");
  }
}

std::string EscapeLike(std::string_view literal) {
  std::string out{};
  out.reserve(literal.size() + 2);
  out.push_back('%');
  for (const char ch : literal) {
    if (ch == '%' || ch == '_' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  out.push_back('%');
  return out;
}

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

using BoundValue = std::variant<std::int64_t, std::string>;

void BindAll(Statement& stmt, const std::vector<BoundValue>& values) {
  int index = 1;
  for (const auto& value : values) {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
      stmt.BindInt64(index, *number);
    } else {
      stmt.BindText(index, std::get<std::string>(value));
    }
    ++index;
  }
}

}  // namespace

std::string_view CountDimensionName(CountDimension dimension) {
  switch (dimension) {
    case CountDimension::kType:
      return "type";
    case CountDimension::kShow:
      return "show";
    case CountDimension::kExtension:
      return "extension";
  }
  return "type";
}

std::optional<CountDimension> ParseCountDimension(std::string_view name) {
  if (name == "type") {
    return CountDimension::kType;
  }
  if (name == "show") {
    return CountDimension::kShow;
  }
  if (name == "extension") {
    return CountDimension::kExtension;
  }
  return std::nullopt;
}

Json ToJson(const CatalogStats& stats) {
  Json counts = Json::array();
  for (const auto& row : stats.counts) {
    counts.push_back({{"key", row.key}, {"count", row.count}});
  }
  return {
      {"total_files", stats.total_files},
      {"group_by", std::string(CountDimensionName(stats.dimension))},
      {"counts", std::move(counts)},
  };
}

std::string NormalizeExtension(std::string_view extension) {
  const auto trimmed = TrimView(extension);
  if (trimmed.empty()) {
    return {};
  }
  std::string out{};
  out.reserve(trimmed.size() + 1);
  if (trimmed.front() != '.') {
    out.push_back('.');
  }
  for (const char ch : trimmed) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

CatalogStore::CatalogStore(std::string path) : path_(std::move(path)) {
  db_ = sqlite::Open(path_);
  try {
    InitSchema();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  spdlog::info("catalog store opened: {}", path_);
}

CatalogStore::~CatalogStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void CatalogStore::InitSchema() {
  sqlite::Exec(db_, kSchema);
}

void CatalogStore::UpsertFile(const CatalogFile& file) {
  UpsertFileLocked(file);
}

void CatalogStore::UpsertFileLocked(const CatalogFile& file) {
  if (file.embedding.has_value() && file.error.has_value()) {
    throw std::invalid_argument("file " + std::to_string(file.id) + " cannot carry both an embedding and an error");
  }
  if (file.embedding.has_value() && file.embedding->size() != kTextEmbeddingDims) {
    throw std::invalid_argument("text embedding must have " + std::to_string(kTextEmbeddingDims) + " dimensions");
  }
  Statement stmt(db_,
                 "INSERT INTO files(id, name, path, extension, type, size, created_at, modified_at, scanned_at, show, "
                 "embedding, error) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12) "
                 "ON CONFLICT(id) DO UPDATE SET name = excluded.name, path = excluded.path, "
                 "extension = excluded.extension, type = excluded.type, size = excluded.size, "
                 "created_at = excluded.created_at, modified_at = excluded.modified_at, "
                 "scanned_at = excluded.scanned_at, show = excluded.show, embedding = excluded.embedding, "
                 "error = excluded.error;");
  stmt.BindInt64(1, file.id);
  stmt.BindText(2, file.name);
  stmt.BindText(3, file.path);
  stmt.BindText(4, NormalizeExtension(file.extension));
  stmt.BindText(5, FileTypeName(file.type));
  stmt.BindInt64(6, file.size);
  stmt.BindInt64(7, file.created_at);
  stmt.BindInt64(8, file.modified_at);
  stmt.BindInt64(9, file.scanned_at);
  stmt.BindOptionalText(10, file.show);
  stmt.BindVector(11, file.embedding);
  stmt.BindOptionalText(12, file.error);
  stmt.Step();
}

void CatalogStore::PutExtension(std::int64_t file_id, const TypedExtension& extension) {
  PutExtensionLocked(file_id, extension);
}

void CatalogStore::PutExtensionLocked(std::int64_t file_id, const TypedExtension& extension) {
  {
    Statement lookup(db_, "SELECT type FROM files WHERE id = ?1;");
    lookup.BindInt64(1, file_id);
    if (!lookup.Step()) {
      throw std::invalid_argument("extension references unknown file " + std::to_string(file_id));
    }
    const auto kind = ExtensionFileType(extension);
    if (lookup.ColumnText(0) != FileTypeName(kind)) {
      throw std::invalid_argument("extension kind " + std::string(FileTypeName(kind)) + " does not match file " +
                                  std::to_string(file_id));
    }
  }

  std::visit(
      [this, file_id](const auto& info) {
        using T = std::decay_t<decltype(info)>;
        if constexpr (std::is_same_v<T, ImageInfo>) {
          RequireVisualDims(info.visual_embedding);
          Statement stmt(db_,
                         "INSERT OR REPLACE INTO images(file_id, width, height, thumbnail_path, visual_embedding, "
                         "color_mode) VALUES(?1, ?2, ?3, ?4, ?5, ?6);");
          stmt.BindInt64(1, file_id);
          stmt.BindInt64(2, info.resolution.width);
          stmt.BindInt64(3, info.resolution.height);
          stmt.BindOptionalText(4, info.thumbnail_path);
          stmt.BindVector(5, info.visual_embedding);
          stmt.BindOptionalText(6, info.color_mode);
          stmt.Step();
        } else if constexpr (std::is_same_v<T, VideoInfo>) {
          RequireVisualDims(info.visual_embedding);
          Statement stmt(db_,
                         "INSERT OR REPLACE INTO videos(file_id, width, height, thumbnail_path, visual_embedding, "
                         "duration_seconds, fps, codec) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
          stmt.BindInt64(1, file_id);
          stmt.BindInt64(2, info.resolution.width);
          stmt.BindInt64(3, info.resolution.height);
          stmt.BindOptionalText(4, info.thumbnail_path);
          stmt.BindVector(5, info.visual_embedding);
          stmt.BindDouble(6, info.duration_seconds);
          stmt.BindDouble(7, info.fps);
          stmt.BindOptionalText(8, info.codec);
          stmt.Step();
        } else if constexpr (std::is_same_v<T, BlendInfo>) {
          RequireVisualDims(info.visual_embedding);
          Statement stmt(db_,
                         "INSERT OR REPLACE INTO blend_files(file_id, width, height, thumbnail_path, visual_embedding, "
                         "render_engine, frame_count) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7);");
          stmt.BindInt64(1, file_id);
          stmt.BindInt64(2, info.resolution.width);
          stmt.BindInt64(3, info.resolution.height);
          stmt.BindOptionalText(4, info.thumbnail_path);
          stmt.BindVector(5, info.visual_embedding);
          stmt.BindOptionalText(6, info.render_engine);
          stmt.BindInt64(7, info.frame_count);
          stmt.Step();
        } else if constexpr (std::is_same_v<T, AudioInfo>) {
          Statement stmt(db_,
                         "INSERT OR REPLACE INTO audio_files(file_id, duration_seconds, bitrate, channels, sample_rate) "
                         "VALUES(?1, ?2, ?3, ?4, ?5);");
          stmt.BindInt64(1, file_id);
          stmt.BindDouble(2, info.duration_seconds);
          stmt.BindInt64(3, info.bitrate);
          stmt.BindInt64(4, info.channels);
          stmt.BindInt64(5, info.sample_rate);
          stmt.Step();
        } else if constexpr (std::is_same_v<T, CodeInfo>) {
          Statement stmt(db_, "INSERT OR REPLACE INTO code_files(file_id, language, line_count) VALUES(?1, ?2, ?3);");
          stmt.BindInt64(1, file_id);
          stmt.BindText(2, info.language);
          stmt.BindInt64(3, info.line_count);
          stmt.Step();
        } else if constexpr (std::is_same_v<T, SpreadsheetInfo>) {
          Statement stmt(db_,
                         "INSERT OR REPLACE INTO spreadsheets(file_id, sheet_count, row_count) VALUES(?1, ?2, ?3);");
          stmt.BindInt64(1, file_id);
          stmt.BindInt64(2, info.sheet_count);
          stmt.BindInt64(3, info.row_count);
          stmt.Step();
        } else {
          Statement stmt(db_, "INSERT OR REPLACE INTO documents(file_id, page_count, word_count) VALUES(?1, ?2, ?3);");
          stmt.BindInt64(1, file_id);
          stmt.BindInt64(2, info.page_count);
          stmt.BindInt64(3, info.word_count);
          stmt.Step();
        }
      },
      extension);
}

bool CatalogStore::DeleteFile(std::int64_t file_id) {
  Statement stmt(db_, "DELETE FROM files WHERE id = ?1;");
  stmt.BindInt64(1, file_id);
  stmt.Step();
  return sqlite3_changes(db_) > 0;
}

void CatalogStore::Import(const std::vector<CatalogRecord>& records) {
  sqlite::Transaction tx(db_);
  for (const auto& record : records) {
    UpsertFileLocked(record.file);
    if (record.extension.has_value()) {
      PutExtensionLocked(record.file.id, *record.extension);
    }
  }
  tx.Commit();
  spdlog::info("catalog import committed: {} files", records.size());
}

std::optional<CatalogRecord> CatalogStore::GetRecord(std::int64_t file_id) const {
  auto records = GetRecords({file_id});
  if (records.empty()) {
    return std::nullopt;
  }
  return std::move(records.front());
}

std::vector<CatalogRecord> CatalogStore::GetRecords(const std::vector<std::int64_t>& ids) const {
  std::vector<CatalogFile> files{};
  files.reserve(ids.size());
  Statement stmt(db_, std::string("SELECT ") + kFileColumns + " FROM files f WHERE f.id = ?1;");
  for (const auto id : ids) {
    stmt.Reset();
    stmt.BindInt64(1, id);
    if (stmt.Step()) {
      files.push_back(ReadFile(stmt));
    }
  }
  return AttachExtensions(std::move(files));
}

std::vector<CatalogRecord> CatalogStore::AttachExtensions(std::vector<CatalogFile> files) const {
  std::vector<CatalogRecord> records{};
  records.reserve(files.size());
  for (auto& file : files) {
    auto extension = LoadExtension(db_, file.id, file.type);
    records.push_back(CatalogRecord{std::move(file), std::move(extension)});
  }
  return records;
}

std::vector<EmbeddingRow> CatalogStore::TextEmbeddings() const {
  Statement stmt(db_, "SELECT id, embedding FROM files WHERE embedding IS NOT NULL ORDER BY id;");
  std::vector<EmbeddingRow> rows{};
  while (stmt.Step()) {
    rows.push_back(EmbeddingRow{stmt.ColumnInt64(0), stmt.ColumnVector(1).value_or(std::vector<float>{})});
  }
  return rows;
}

std::vector<EmbeddingRow> CatalogStore::VisualEmbeddings(FileType extension_type) const {
  Statement stmt(db_,
                 std::string("SELECT file_id, visual_embedding FROM ") + VisualTable(extension_type) +
                     " WHERE visual_embedding IS NOT NULL ORDER BY file_id;");
  std::vector<EmbeddingRow> rows{};
  while (stmt.Step()) {
    rows.push_back(EmbeddingRow{stmt.ColumnInt64(0), stmt.ColumnVector(1).value_or(std::vector<float>{})});
  }
  return rows;
}

std::vector<CatalogRecord> CatalogStore::KeywordMatches(std::string_view literal, int limit) const {
  const auto trimmed = TrimView(literal);
  if (trimmed.empty() || limit <= 0) {
    return {};
  }
  Statement stmt(db_,
                 std::string("SELECT ") + kFileColumns +
                     " FROM files f WHERE lower(f.name) LIKE ?1 ESCAPE '\\' OR lower(f.path) LIKE ?1 ESCAPE '\\' "
                     "OR lower(COALESCE(f.show, '')) LIKE ?1 ESCAPE '\\' "
                     "ORDER BY f.modified_at DESC, f.id ASC LIMIT ?2;");
  stmt.BindText(1, EscapeLike(trimmed));
  stmt.BindInt64(2, limit);
  return AttachExtensions(ReadFiles(stmt));
}

std::vector<CatalogRecord> CatalogStore::FilterMatches(const FilterPredicates& predicates, int limit) const {
  if (limit <= 0) {
    return {};
  }
  std::string sql = std::string("SELECT ") + kFileColumns + " FROM files f WHERE 1 = 1";
  std::vector<BoundValue> values{};
  auto next = [&values](BoundValue value) {
    values.push_back(std::move(value));
    return "?" + std::to_string(values.size());
  };

  if (predicates.file_type.has_value()) {
    sql += " AND f.type = " + next(std::string(FileTypeName(*predicates.file_type)));
  }
  if (predicates.extension.has_value()) {
    sql += " AND f.extension = " + next(NormalizeExtension(*predicates.extension));
  }
  if (predicates.show.has_value()) {
    std::string show(TrimView(*predicates.show));
    std::transform(show.begin(), show.end(), show.begin(), [](unsigned char ch) {
      return static_cast<char>(std::tolower(ch));
    });
    sql += " AND lower(f.show) = " + next(std::move(show));
  }
  if (predicates.min_resolution_x.has_value() || predicates.min_resolution_y.has_value()) {
    std::string bounds{};
    if (predicates.min_resolution_x.has_value()) {
      bounds += " AND v.width >= " + next(static_cast<std::int64_t>(*predicates.min_resolution_x));
    }
    if (predicates.min_resolution_y.has_value()) {
      bounds += " AND v.height >= " + next(static_cast<std::int64_t>(*predicates.min_resolution_y));
    }
    sql += " AND EXISTS (SELECT 1 FROM (SELECT file_id, width, height FROM images UNION ALL "
           "SELECT file_id, width, height FROM videos UNION ALL SELECT file_id, width, height FROM blend_files) v "
           "WHERE v.file_id = f.id" +
           bounds + ")";
  }
  sql += " ORDER BY f.modified_at DESC, f.id ASC LIMIT " + next(static_cast<std::int64_t>(limit)) + ";";

  Statement stmt(db_, sql);
  BindAll(stmt, values);
  return AttachExtensions(ReadFiles(stmt));
}

CatalogStats CatalogStore::CountBy(CountDimension dimension) const {
  const char* sql = nullptr;
  switch (dimension) {
    case CountDimension::kType:
      sql = "SELECT type, COUNT(*) AS n FROM files GROUP BY type ORDER BY n DESC, type ASC;";
      break;
    case CountDimension::kShow:
      sql = "SELECT COALESCE(show, '(none)') AS k, COUNT(*) AS n FROM files GROUP BY k ORDER BY n DESC, k ASC;";
      break;
    case CountDimension::kExtension:
      sql = "SELECT extension, COUNT(*) AS n FROM files GROUP BY extension ORDER BY n DESC, extension ASC;";
      break;
  }
  CatalogStats stats{};
  stats.dimension = dimension;
  Statement stmt(db_, sql);
  while (stmt.Step()) {
    stats.counts.push_back(CountRow{stmt.ColumnText(0), stmt.ColumnInt64(1)});
    stats.total_files += stats.counts.back().count;
  }
  return stats;
}

std::int64_t CatalogStore::TotalFiles() const {
  Statement stmt(db_, "SELECT COUNT(*) FROM files;");
  if (!stmt.Step()) {
    return 0;
  }
  return stmt.ColumnInt64(0);
}

}  // namespace sceneseek
