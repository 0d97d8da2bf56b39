// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::MariaStatement -- prepared statement for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_STMT* with RAII
//   - Move-only (no copy)
//   - Parameters bound from a Params vector through the MariaDB codec
//   - ExecDml() for INSERT/UPDATE/DELETE, ExecQuery() for SELECT
//   - ExecQuery() binds typed result buffers (binary protocol) and
//     materialises every row into a QueryResult; a failure on any row
//     leaves the output untouched

#pragma once

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <mysql.h>

#include "sqlbridge/error.hpp"
#include "sqlbridge/maria_codec.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

class MariaDb;

// ---------------------------------------------------------------------------
// MariaStatement
// ---------------------------------------------------------------------------

class MariaStatement {
 public:
  MariaStatement() = default;

  ~MariaStatement() { Finalize(); }

  // Move
  MariaStatement(MariaStatement&& other) noexcept
      : stmt_(other.stmt_),
        params_(std::move(other.params_)),
        num_params_(other.num_params_) {
    other.stmt_ = nullptr;
    other.num_params_ = 0;
  }

  MariaStatement& operator=(MariaStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      params_ = std::move(other.params_);
      num_params_ = other.num_params_;
      other.stmt_ = nullptr;
      other.num_params_ = 0;
    }
    return *this;
  }

  // No copy
  MariaStatement(const MariaStatement&) = delete;
  MariaStatement& operator=(const MariaStatement&) = delete;

  // --- Bind ---

  /// Bind params[i] to placeholder i. The Values must stay alive until
  /// the statement has been executed.
  Error BindAll(const Params& params) {
    if (stmt_ == nullptr) { return NotCompiled(); }
    if (static_cast<int32_t>(params.size()) != num_params_) {
      Error err;
      err.SetFormat(ErrorCode::kParameterCount,
                    "statement has %d placeholders, %zu parameters given",
                    num_params_, params.size());
      return err;
    }
    if (num_params_ == 0) { return Error::Ok(); }
    MariaEncodeParams(params, &params_);
    if (mysql_stmt_bind_param(stmt_, params_.binds.data()) != 0) {
      return StmtError();
    }
    return Error::Ok();
  }

  int32_t ParamCount() const { return num_params_; }

  // --- Execute ---

  /// Execute DML. Returns affected row count, or -1 on error.
  int64_t ExecDml(Error* out_error = nullptr) {
    Error err = (stmt_ == nullptr) ? NotCompiled() : Execute();
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    // Discard a result set if the statement produced one.
    mysql_stmt_free_result(stmt_);
    return static_cast<int64_t>(mysql_stmt_affected_rows(stmt_));
  }

  /// Execute SELECT and fetch all rows into `out`.
  Error ExecQuery(QueryResult* out) {
    if (stmt_ == nullptr) { return NotCompiled(); }
    Error exec_err = Execute();
    if (!exec_err.ok()) { return exec_err; }

    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt_);
    if (meta == nullptr) {
      // No result set (e.g. an UPDATE issued through Query()).
      if (out != nullptr) { *out = QueryResult{}; }
      return Error::Ok();
    }
    uint32_t n = mysql_num_fields(meta);
    const MYSQL_FIELD* fields = mysql_fetch_fields(meta);

    MariaResultBuffer buf;
    std::vector<Column> columns;
    MariaPrepareResult(fields, n, &buf, &columns);
    QueryResult result(std::move(columns));

    Error err;
    if (mysql_stmt_bind_result(stmt_, buf.binds.data()) != 0 ||
        mysql_stmt_store_result(stmt_) != 0) {
      err = StmtError();
    }
    while (err.ok()) {
      int32_t rc = mysql_stmt_fetch(stmt_);
      if (rc == MYSQL_NO_DATA) { break; }
      if (rc == 1) {
        err = StmtError();
        break;
      }
      if (rc == MYSQL_DATA_TRUNCATED) {
        err = FetchTruncated(&buf);
        if (!err.ok()) { break; }
      }
      Row row;
      row.reserve(n);
      for (uint32_t i = 0; i < n && err.ok(); ++i) {
        row.push_back(MariaDecodeColumn(fields[i], buf, i, &err));
      }
      if (err.ok()) { err = result.AddRow(std::move(row)); }
    }

    mysql_stmt_free_result(stmt_);
    mysql_free_result(meta);
    if (err.ok() && out != nullptr) { *out = std::move(result); }
    return err;
  }

  int64_t LastInsertId() const {
    return stmt_ != nullptr
               ? static_cast<int64_t>(mysql_stmt_insert_id(stmt_)) : 0;
  }

  // --- Reset ---

  Error Reset() {
    if (stmt_ == nullptr) { return NotCompiled(); }
    if (mysql_stmt_reset(stmt_) != 0) { return StmtError(); }
    params_ = MariaParamBuffer{};
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      mysql_stmt_close(stmt_);
      stmt_ = nullptr;
    }
    params_ = MariaParamBuffer{};
    num_params_ = 0;
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class MariaDb;

  explicit MariaStatement(MYSQL_STMT* stmt) : stmt_(stmt) {
    if (stmt_ != nullptr) {
      num_params_ = static_cast<int32_t>(mysql_stmt_param_count(stmt_));
    }
  }

  static Error NotCompiled() {
    return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
  }

  Error Execute() {
    return mysql_stmt_execute(stmt_) != 0 ? StmtError() : Error::Ok();
  }

  Error StmtError() const {
    Error err;
    SetMariaError(&err, mysql_stmt_errno(stmt_), mysql_stmt_error(stmt_));
    return err;
  }

  // Grow the buffers of truncated columns and re-read them.
  Error FetchTruncated(MariaResultBuffer* buf) {
    for (size_t i = 0; i < buf->binds.size(); ++i) {
      if (buf->errors[i] == 0) { continue; }
      unsigned long need = buf->lengths[i];
      buf->bytes[i].resize(need);
      MYSQL_BIND& b = buf->binds[i];
      b.buffer = buf->bytes[i].data();
      b.buffer_length = need;
      if (mysql_stmt_fetch_column(stmt_, &b, static_cast<unsigned int>(i),
                                  0) != 0) {
        return StmtError();
      }
      buf->errors[i] = 0;
    }
    // Re-register the grown buffers for the following rows.
    if (mysql_stmt_bind_result(stmt_, buf->binds.data()) != 0) {
      return StmtError();
    }
    return Error::Ok();
  }

  MYSQL_STMT* stmt_ = nullptr;
  MariaParamBuffer params_;
  int32_t num_params_ = 0;
};

}  // namespace sqlbridge
