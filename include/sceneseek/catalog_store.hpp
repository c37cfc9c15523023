#pragma once

#include "sceneseek/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace sceneseek {

enum class CountDimension {
  kType,
  kShow,
  kExtension,
};

std::string_view CountDimensionName(CountDimension dimension);
std::optional<CountDimension> ParseCountDimension(std::string_view name);

struct FilterPredicates {
  std::optional<FileType> file_type;
  std::optional<int> min_resolution_x;
  std::optional<int> min_resolution_y;
  std::optional<std::string> extension;
  std::optional<std::string> show;
};

struct EmbeddingRow {
  std::int64_t file_id = 0;
  std::vector<float> vector;
};

struct CountRow {
  std::string key;
  std::int64_t count = 0;
};

struct CatalogStats {
  std::int64_t total_files = 0;
  CountDimension dimension = CountDimension::kType;
  std::vector<CountRow> counts;
};

Json ToJson(const CatalogStats& stats);

// Lower-cases and prefixes a dot: "BLEND" -> ".blend".
std::string NormalizeExtension(std::string_view extension);

// SQLite-backed catalog: `files` plus one extension table per typed extension,
// each bound to its file by ON DELETE CASCADE. Read-only while serving.
class CatalogStore {
 public:
  explicit CatalogStore(std::string path);
  ~CatalogStore();

  CatalogStore(const CatalogStore&) = delete;
  CatalogStore& operator=(const CatalogStore&) = delete;

  [[nodiscard]] const std::string& path() const { return path_; }

  void UpsertFile(const CatalogFile& file);
  void PutExtension(std::int64_t file_id, const TypedExtension& extension);
  bool DeleteFile(std::int64_t file_id);
  // Upserts every record and its extension in one transaction.
  void Import(const std::vector<CatalogRecord>& records);

  std::optional<CatalogRecord> GetRecord(std::int64_t file_id) const;
  // Preserves the order of `ids`; unknown ids are skipped.
  std::vector<CatalogRecord> GetRecords(const std::vector<std::int64_t>& ids) const;

  std::vector<EmbeddingRow> TextEmbeddings() const;
  std::vector<EmbeddingRow> VisualEmbeddings(FileType extension_type) const;

  // Substring match on name, path and show, newest first. Case folding is
  // ASCII only (SQLite lower()); other characters must match exactly.
  std::vector<CatalogRecord> KeywordMatches(std::string_view literal, int limit) const;
  // Newest first. Minimum resolution holds when one visual extension meets
  // both bounds.
  std::vector<CatalogRecord> FilterMatches(const FilterPredicates& predicates, int limit) const;

  CatalogStats CountBy(CountDimension dimension) const;
  std::int64_t TotalFiles() const;

 private:
  void InitSchema();
  void UpsertFileLocked(const CatalogFile& file);
  void PutExtensionLocked(std::int64_t file_id, const TypedExtension& extension);
  std::vector<CatalogRecord> AttachExtensions(std::vector<CatalogFile> files) const;

  std::string path_;
  sqlite3* db_ = nullptr;
};

}  // namespace sceneseek
