// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::MariaSession -- Session implementation for the networked
// backend (requires SQLBRIDGE_HAS_MARIADB=1).
//
// Design:
//   - Owns one MariaDb connection
//   - All statements go through the binary protocol (prepared statements),
//     so parameters are never spliced into SQL text
//   - Transaction control uses the text protocol

#pragma once

#include <memory>
#include <utility>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/maria_db.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/session.hpp"

namespace sqlbridge {

class MariaSession : public Session {
 public:
  explicit MariaSession(MariaDb db) : db_(std::move(db)) {}

  static std::unique_ptr<Session> Open(const BackendTarget& target,
                                       int32_t busy_timeout_ms,
                                       Error* out_error) {
    MariaDb db;
    Error err = db.Open(target.dsn.c_str());
    if (!err.ok()) {
      Report(out_error, err);
      return nullptr;
    }
    err = db.SetBusyTimeout(busy_timeout_ms);
    if (!err.ok()) {
      Report(out_error, err);
      return nullptr;
    }
    return std::unique_ptr<Session>(new MariaSession(std::move(db)));
  }

  BackendKind Kind() const override { return BackendKind::kNetworked; }

  Error Execute(const char* sql, const Params& params,
                ExecResult* out) override {
    Error err;
    MariaStatement stmt = db_.CompileStatement(sql, &err);
    if (!stmt.Valid()) { return err; }
    err = stmt.BindAll(params);
    if (!err.ok()) { return WithStatement(err, sql); }

    int64_t affected = stmt.ExecDml(&err);
    if (affected < 0) { return WithStatement(err, sql); }
    if (out != nullptr) {
      out->affected_rows = affected;
      out->last_insert_id = stmt.LastInsertId();
    }
    return Error::Ok();
  }

  Error Query(const char* sql, const Params& params,
              QueryResult* out) override {
    Error err;
    MariaStatement stmt = db_.CompileStatement(sql, &err);
    if (!stmt.Valid()) { return err; }
    err = stmt.BindAll(params);
    if (!err.ok()) { return WithStatement(err, sql); }

    QueryResult result;
    err = stmt.ExecQuery(&result);
    if (!err.ok()) { return WithStatement(err, sql); }
    if (out != nullptr) { *out = std::move(result); }
    return Error::Ok();
  }

  Error Begin() override { return db_.BeginTransaction(); }
  Error Commit() override { return db_.Commit(); }
  Error Rollback() override { return db_.Rollback(); }
  Error Ping() override { return db_.Ping(); }

  MariaDb& Db() { return db_; }

 private:
  static Error WithStatement(Error err, const char* sql) {
    err.SetStatement(sql);
    return err;
  }

  MariaDb db_;
};

}  // namespace sqlbridge
