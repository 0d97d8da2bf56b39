// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding (matches SQLite3 convention)
//   - Values are bound through the SQLite3 codec
//   - ExecDml() for INSERT/UPDATE/DELETE, ExecQuery() for SELECT

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "sqlbridge/error.hpp"
#include "sqlbridge/sqlite3_codec.hpp"
#include "sqlbridge/sqlite3_query.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Run to completion and return the affected row count, or -1 on error.
  /// Rows produced by the statement are stepped over.
  int64_t ExecDml(Error* out_error = nullptr) {
    if (!Ready(out_error)) { return -1; }
    int32_t rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) { rc = sqlite3_step(stmt_); }
    int64_t changes = -1;
    if (rc == SQLITE_DONE) {
      changes = static_cast<int64_t>(sqlite3_changes(db_));
    } else {
      SetSqlite3Error(out_error, db_, rc, sqlite3_sql(stmt_));
    }
    sqlite3_reset(stmt_);
    return changes;
  }

  /// Step to the first row and hand the statement to a Sqlite3Query.
  /// This statement is left empty on success.
  Sqlite3Query ExecQuery(Error* out_error = nullptr) {
    if (!Ready(out_error)) { return Sqlite3Query{}; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
      SetSqlite3Error(out_error, db_, rc, sqlite3_sql(stmt_));
      sqlite3_reset(stmt_);
      return Sqlite3Query{};
    }
    sqlite3_stmt* owned = stmt_;
    stmt_ = nullptr;
    return Sqlite3Query(db_, owned, rc == SQLITE_DONE);
  }

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const Value& value) {
    return Sqlite3BindValue(stmt_, param, value);
  }

  /// Bind params[i] to placeholder i + 1.
  Error BindAll(const Params& params) {
    for (size_t i = 0; i < params.size(); ++i) {
      Error err = Bind(static_cast<int32_t>(i + 1), params[i]);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  int32_t ParamCount() const {
    return stmt_ != nullptr ? sqlite3_bind_parameter_count(stmt_) : 0;
  }

  // --- Reset ---

  /// Rewind for another execution and clear all bindings.
  Error Reset() {
    Error err;
    if (!Ready(&err)) { return err; }
    int32_t rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) { SetSqlite3Error(&err, db_, rc); }
    sqlite3_clear_bindings(stmt_);
    return err;
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class Sqlite3Db;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  bool Ready(Error* out_error) const {
    if (db_ != nullptr && stmt_ != nullptr) { return true; }
    Report(out_error,
           Error::Make(ErrorCode::kMisuse, "Statement not initialized"));
    return false;
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace sqlbridge
