// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Sqlite3Db -- SQLite3 database handle with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Native result codes mapped to sqlbridge codes (sqlite3_codec.hpp)
//   - Transaction support (Begin/Commit/Rollback)
//   - Not shared between threads: the owning session is leased to one
//     caller at a time

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "sqlite3.h"

#include "sqlbridge/error.hpp"
#include "sqlbridge/sqlite3_codec.hpp"
#include "sqlbridge/sqlite3_query.hpp"
#include "sqlbridge/sqlite3_statement.hpp"

namespace sqlbridge {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  Sqlite3Db() = default;

  ~Sqlite3Db() { Close(); }

  // Move
  Sqlite3Db(Sqlite3Db&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  /// Open (or create) the database at `path`. ":memory:" and "file:" URIs
  /// are accepted.
  Error Open(const char* path) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    int32_t flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_URI;
    int32_t rc = sqlite3_open_v2(path, &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err;
      SetSqlite3Error(&err, db_, rc);
      err.connection_fatal = true;
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    sqlite3_extended_result_codes(db_, 1);
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute one or more statements without parameters
  /// (CREATE/DROP/INSERT/UPDATE/DELETE/BEGIN/...).
  /// Returns number of affected rows, or -1 on error.
  int64_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!Ready(sql, out_error)) { return -1; }
    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    sqlite3_free(errmsg);
    if (rc != SQLITE_OK) {
      SetSqlite3Error(out_error, db_, rc, sql);
      return -1;
    }
    return static_cast<int64_t>(sqlite3_changes(db_));
  }

  // --- Query ---

  /// Execute SELECT without parameters. Returns Sqlite3Query for forward
  /// iteration.
  Sqlite3Query ExecQuery(const char* sql, Error* out_error = nullptr) {
    Sqlite3Statement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return Sqlite3Query{}; }
    return stmt.ExecQuery(out_error);
  }

  // --- Statement ---

  /// Compile a prepared statement.
  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    if (!Ready(sql, out_error)) { return Sqlite3Statement{}; }
    sqlite3_stmt* stmt = Compile(sql, out_error);
    return stmt != nullptr ? Sqlite3Statement(db_, stmt) : Sqlite3Statement{};
  }

  // --- Transaction ---

  Error BeginTransaction() { return Control("BEGIN TRANSACTION;"); }
  Error Commit() { return Control("COMMIT TRANSACTION;"); }
  Error Rollback() { return Control("ROLLBACK;"); }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  // --- Misc ---

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

  int64_t LastInsertId() const {
    if (db_ == nullptr) { return 0; }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
  }

 private:
  bool Ready(const char* sql, Error* out_error) const {
    if (db_ == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database not open"));
      return false;
    }
    if (sql == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNullParam, "sql is null"));
      return false;
    }
    return true;
  }

  Error Control(const char* sql) {
    Error err;
    ExecDml(sql, &err);
    return err;
  }

  sqlite3_stmt* Compile(const char* sql, Error* out_error) {
    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
      SetSqlite3Error(out_error, db_, rc, sql);
      if (out_error != nullptr && out_error->code == ErrorCode::kError) {
        // prepare reports unknown tables and bad grammar as SQLITE_ERROR
        out_error->code = ErrorCode::kSyntax;
      }
      return nullptr;
    }
    if (stmt == nullptr) {
      // Empty statement (only whitespace or comments).
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "empty statement");
        out_error->SetStatement(sql);
      }
      return nullptr;
    }
    // One statement per call; a trailing second one would never run.
    if (!IsBlankTail(tail)) {
      sqlite3_finalize(stmt);
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse,
                       "multiple statements in one call");
        out_error->SetStatement(sql);
      }
      return nullptr;
    }
    return stmt;
  }

  /// True if `p` holds only whitespace, ';' and comments.
  static bool IsBlankTail(const char* p) {
    while (p != nullptr && *p != '\0') {
      if (std::isspace(static_cast<unsigned char>(*p)) != 0 || *p == ';') {
        ++p;
      } else if (p[0] == '-' && p[1] == '-') {
        while (*p != '\0' && *p != '\n') { ++p; }
      } else if (p[0] == '/' && p[1] == '*') {
        const char* end = std::strstr(p + 2, "*/");
        if (end == nullptr) { return true; }  // unterminated: rest is comment
        p = end + 2;
      } else {
        return false;
      }
    }
    return true;
  }

  sqlite3* db_ = nullptr;
};

}  // namespace sqlbridge
