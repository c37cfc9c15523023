#pragma once

#include "sqlite3.h"

#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sceneseek::sqlite {

inline std::string ErrorMessage(sqlite3* db, const char* op) {
  return std::string("sqlite ") + op + " failed: " + (db != nullptr ? sqlite3_errmsg(db) : "no connection");
}

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(ErrorMessage(db_, "prepare"));
    }
  }

  Statement(sqlite3* db, const std::string& sql) : Statement(db, sql.c_str()) {}

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void BindInt64(int index, std::int64_t value) { Check(sqlite3_bind_int64(stmt_, index, value)); }

  void BindDouble(int index, double value) { Check(sqlite3_bind_double(stmt_, index, value)); }

  void BindText(int index, std::string_view value) {
    Check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void BindNull(int index) { Check(sqlite3_bind_null(stmt_, index)); }

  void BindOptionalText(int index, const std::optional<std::string>& value) {
    if (value.has_value()) {
      BindText(index, *value);
    } else {
      BindNull(index);
    }
  }

  // float32 little-endian blob.
  void BindVector(int index, const std::optional<std::vector<float>>& value) {
    if (!value.has_value()) {
      BindNull(index);
      return;
    }
    Check(sqlite3_bind_blob(stmt_,
                            index,
                            value->data(),
                            static_cast<int>(value->size() * sizeof(float)),
                            SQLITE_TRANSIENT));
  }

  // True while rows remain.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw std::runtime_error(ErrorMessage(db_, "step"));
  }

  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  bool IsNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

  std::int64_t ColumnInt64(int column) const { return sqlite3_column_int64(stmt_, column); }

  double ColumnDouble(int column) const { return sqlite3_column_double(stmt_, column); }

  std::string ColumnText(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
  }

  std::optional<std::string> ColumnOptionalText(int column) const {
    if (IsNull(column)) {
      return std::nullopt;
    }
    return ColumnText(column);
  }

  std::optional<std::vector<float>> ColumnVector(int column) const {
    if (IsNull(column)) {
      return std::nullopt;
    }
    const auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column));
    std::vector<float> out(bytes / sizeof(float), 0.0F);
    if (!out.empty()) {
      std::memcpy(out.data(), sqlite3_column_blob(stmt_, column), out.size() * sizeof(float));
    }
    return out;
  }

 private:
  void Check(int rc) const {
    if (rc != SQLITE_OK) {
      throw std::runtime_error(ErrorMessage(db_, "bind"));
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

inline void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw std::runtime_error(message);
}

// Opens with the full-mutex threading mode so one connection can be shared by
// concurrently executing tools. File databases switch to WAL.
inline sqlite3* Open(const std::string& path) {
  sqlite3* db = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string message = ErrorMessage(db, "open");
    sqlite3_close(db);
    throw std::runtime_error(message + " (" + path + ")");
  }
  try {
    Exec(db, "PRAGMA foreign_keys=ON;");
    Exec(db, "PRAGMA busy_timeout=5000;");
    if (path != ":memory:") {
      Exec(db, "PRAGMA journal_mode=WAL;");
    }
  } catch (const std::exception&) {
    sqlite3_close(db);
    throw;
  }
  return db;
}

// Rolls back unless Commit() was reached.
class Transaction final {
 public:
  explicit Transaction(sqlite3* db) : db_(db) { Exec(db_, "BEGIN IMMEDIATE;"); }

  ~Transaction() {
    if (!committed_) {
      sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit() {
    Exec(db_, "COMMIT;");
    committed_ = true;
  }

 private:
  sqlite3* db_ = nullptr;
  bool committed_ = false;
};

}  // namespace sceneseek::sqlite
