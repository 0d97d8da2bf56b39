// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Sqlite3Query -- forward-only cursor over a stepped statement.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow(); step failures are reported,
//     not folded into end-of-rows
//   - Cells are decoded to Value through the SQLite3 codec

#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "sqlite3.h"

#include "sqlbridge/error.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/sqlite3_codec.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

class Sqlite3Db;
class Sqlite3Statement;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;

  ~Sqlite3Query() { Finalize(); }

  // Move
  Sqlite3Query(Sqlite3Query&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (stmt_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      const char* col_name = sqlite3_column_name(stmt_, i);
      if (col_name != nullptr && std::strcmp(name, col_name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    return HasColumn(col) ? sqlite3_column_name(stmt_, col) : nullptr;
  }

  /// Column schema; the type hint comes from the declared column type.
  std::vector<Column> Columns() const {
    std::vector<Column> cols;
    cols.reserve(static_cast<size_t>(num_fields_));
    for (int32_t i = 0; i < num_fields_; ++i) {
      Column c;
      const char* name = sqlite3_column_name(stmt_, i);
      const char* decl = sqlite3_column_decltype(stmt_, i);
      c.name = (name != nullptr) ? name : "";
      c.decl_type = (decl != nullptr) ? decl : "";
      c.type_hint = Sqlite3HintFromDeclType(decl);
      cols.push_back(std::move(c));
    }
    return cols;
  }

  bool FieldIsNull(int32_t col) const {
    return !HasColumn(col) || sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  // --- Field values ---

  Value GetValue(int32_t col, Error* out_error = nullptr) const {
    if (eof_ || !HasColumn(col)) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kRange, "column %d out of range", col);
        out_error->index = col;
      }
      return Value::Null();
    }
    return Sqlite3DecodeColumn(stmt_, col, out_error);
  }

  /// Decode the whole current row. Returns false (with out_error set) on
  /// the first malformed cell.
  bool GetRow(Row* out, Error* out_error = nullptr) const {
    out->clear();
    out->reserve(static_cast<size_t>(num_fields_));
    for (int32_t i = 0; i < num_fields_; ++i) {
      Error err;
      Value v = GetValue(i, &err);
      if (!err.ok()) {
        Report(out_error, err);
        return false;
      }
      out->push_back(std::move(v));
    }
    return true;
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Advance to the next row. A step failure ends the cursor and is
  /// reported through out_error.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr || eof_) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE) {
      SetSqlite3Error(out_error, db_, rc, sqlite3_sql(stmt_));
    }
  }

  /// Drain the remaining rows into `out`. All or nothing: on error `out`
  /// is left untouched.
  Error Fetch(QueryResult* out) {
    QueryResult result(Columns());
    Row row;
    Error err;
    while (!eof_) {
      if (!GetRow(&row, &err)) { break; }
      err = result.AddRow(std::move(row));
      if (!err.ok()) { break; }
      NextRow(&err);
      if (!err.ok()) { break; }
    }
    if (!err.ok()) {
      if (stmt_ != nullptr) { err.SetStatement(sqlite3_sql(stmt_)); }
      return err;
    }
    if (out != nullptr) { *out = std::move(result); }
    return err;
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class Sqlite3Db;
  friend class Sqlite3Statement;

  bool HasColumn(int32_t col) const {
    return stmt_ != nullptr && col >= 0 && col < num_fields_;
  }

  Sqlite3Query(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
};

}  // namespace sqlbridge
