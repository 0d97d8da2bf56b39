// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::MariaDb -- MariaDB/MySQL connection with RAII.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Client/server errno mapped to sqlbridge codes (maria_codec.hpp)
//   - Transaction support (Begin/Commit/Rollback)
//   - API mirrors Sqlite3Db so both sessions read the same way
//
// Open() takes a DSN, see ParseDsn() in config.hpp.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>

#include <mysql.h>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/maria_codec.hpp"
#include "sqlbridge/maria_statement.hpp"

namespace sqlbridge {

// ---------------------------------------------------------------------------
// MariaDb
// ---------------------------------------------------------------------------

class MariaDb {
 public:
  MariaDb() = default;

  ~MariaDb() { Close(); }

  // Move
  MariaDb(MariaDb&& other) noexcept
      : conn_(other.conn_), in_transaction_(other.in_transaction_) {
    other.conn_ = nullptr;
    other.in_transaction_ = false;
  }

  MariaDb& operator=(MariaDb&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      in_transaction_ = other.in_transaction_;
      other.conn_ = nullptr;
      other.in_transaction_ = false;
    }
    return *this;
  }

  // No copy
  MariaDb(const MariaDb&) = delete;
  MariaDb& operator=(const MariaDb&) = delete;

  // --- Open / Close ---

  /// Open connection. Format: "host:port:user:password:database".
  Error Open(const char* dsn, uint32_t connect_timeout_s = 10) {
    DsnConfig cfg;
    Error err = ParseDsn(dsn, &cfg);
    if (!err.ok()) { return err; }
    Close();

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }
    mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_s);
    // Never let the client silently reconnect: a lost session must surface
    // so the pool can discard it.
    my_bool reconnect = 0;
    mysql_options(conn_, MYSQL_OPT_RECONNECT, &reconnect);

    const char* password = cfg.password.empty() ? nullptr
                                                : cfg.password.c_str();
    const char* database = cfg.database.empty() ? nullptr
                                                : cfg.database.c_str();
    if (mysql_real_connect(conn_, cfg.host.c_str(), cfg.user.c_str(),
                           password, database, cfg.port, nullptr,
                           0) == nullptr) {
      Error connect_err;
      SetMariaError(&connect_err, mysql_errno(conn_), mysql_error(conn_));
      connect_err.connection_fatal = true;
      mysql_close(conn_);
      conn_ = nullptr;
      return connect_err;
    }

    if (mysql_set_character_set(conn_, "utf8mb4") != 0) {
      Error cs_err;
      SetMariaError(&cs_err, mysql_errno(conn_), mysql_error(conn_));
      Close();
      return cs_err;
    }
    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
    in_transaction_ = false;
  }

  bool IsOpen() const { return conn_ != nullptr; }

  // --- DML ---

  /// Execute a statement without parameters over the text protocol.
  /// Returns affected row count, or -1 on error.
  int64_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!Ready(sql, out_error)) { return -1; }
    if (mysql_query(conn_, sql) != 0) {
      SetMariaError(out_error, mysql_errno(conn_), mysql_error(conn_), sql);
      return -1;
    }
    // A statement that returned rows must be drained before the next one.
    mysql_free_result(mysql_store_result(conn_));
    return static_cast<int64_t>(mysql_affected_rows(conn_));
  }

  // --- Statement ---

  MariaStatement CompileStatement(const char* sql,
                                  Error* out_error = nullptr) {
    if (!Ready(sql, out_error)) { return MariaStatement{}; }
    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (stmt == nullptr) {
      SetMariaError(out_error, mysql_errno(conn_), "mysql_stmt_init failed",
                    sql);
      return MariaStatement{};
    }
    unsigned long len = static_cast<unsigned long>(std::strlen(sql));
    if (mysql_stmt_prepare(stmt, sql, len) != 0) {
      SetMariaError(out_error, mysql_stmt_errno(stmt), mysql_stmt_error(stmt),
                    sql);
      mysql_stmt_close(stmt);
      return MariaStatement{};
    }
    return MariaStatement(stmt);
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err = Control("START TRANSACTION;");
    in_transaction_ = err.ok();
    return err;
  }

  Error Commit() {
    in_transaction_ = false;
    return Control("COMMIT;");
  }

  Error Rollback() {
    in_transaction_ = false;
    return Control("ROLLBACK;");
  }

  bool InTransaction() const { return in_transaction_; }

  // --- Misc ---

  /// Round-trip to the server. Fails with kConnectionLost if the session
  /// is gone.
  Error Ping() {
    Error err;
    if (!Ready("", &err)) { return err; }
    if (mysql_ping(conn_) != 0) {
      SetMariaError(&err, mysql_errno(conn_), mysql_error(conn_));
    }
    return err;
  }

  /// Lock wait bound, mapped to innodb_lock_wait_timeout (seconds).
  Error SetBusyTimeout(int32_t ms) {
    int32_t secs = (ms <= 0) ? 1 : (ms + 999) / 1000;
    char sql[64];
    std::snprintf(sql, sizeof(sql),
                  "SET SESSION innodb_lock_wait_timeout = %d", secs);
    return Control(sql);
  }

 private:
  bool Ready(const char* sql, Error* out_error) const {
    if (conn_ == nullptr) {
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

  MYSQL* conn_ = nullptr;
  bool in_transaction_ = false;
};

}  // namespace sqlbridge
