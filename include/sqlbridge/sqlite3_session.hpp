// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Sqlite3Session -- Session implementation for the embedded
// backend.
//
// Design:
//   - Owns one Sqlite3Db
//   - Every call compiles a statement, binds Params through the codec and
//     steps it; Query() decodes all rows before returning
//   - Calls block the calling thread; synchronous Database calls run
//     them on the caller's thread, ExecuteAsync()/QueryAsync() on the
//     dedicated embedded executor

#pragma once

#include <memory>
#include <utility>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/session.hpp"
#include "sqlbridge/sqlite3_db.hpp"

namespace sqlbridge {

class Sqlite3Session : public Session {
 public:
  explicit Sqlite3Session(Sqlite3Db db) : db_(std::move(db)) {}

  static std::unique_ptr<Session> Open(const BackendTarget& target,
                                       int32_t busy_timeout_ms,
                                       Error* out_error) {
    Sqlite3Db db;
    Error err = db.Open(target.dsn.c_str());
    if (!err.ok()) {
      Report(out_error, err);
      return nullptr;
    }
    db.SetBusyTimeout(busy_timeout_ms);
    return std::unique_ptr<Session>(new Sqlite3Session(std::move(db)));
  }

  BackendKind Kind() const override { return BackendKind::kEmbedded; }

  Error Execute(const char* sql, const Params& params,
                ExecResult* out) override {
    Error err;
    Sqlite3Statement stmt = db_.CompileStatement(sql, &err);
    if (!stmt.Valid()) { return err; }
    err = stmt.BindAll(params);
    if (!err.ok()) { return err; }

    int64_t changes = stmt.ExecDml(&err);
    if (changes < 0) { return err; }
    if (out != nullptr) {
      out->affected_rows = changes;
      out->last_insert_id = db_.LastInsertId();
    }
    return Error::Ok();
  }

  Error Query(const char* sql, const Params& params,
              QueryResult* out) override {
    Error err;
    Sqlite3Statement stmt = db_.CompileStatement(sql, &err);
    if (!stmt.Valid()) { return err; }
    err = stmt.BindAll(params);
    if (!err.ok()) { return err; }

    Sqlite3Query q = stmt.ExecQuery(&err);
    if (!err.ok()) { return err; }

    return q.Fetch(out);
  }

  Error Begin() override { return db_.BeginTransaction(); }
  Error Commit() override { return db_.Commit(); }
  Error Rollback() override { return db_.Rollback(); }

  Error Ping() override {
    if (!db_.IsOpen()) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    return Error::Ok();
  }


 private:
  Sqlite3Db db_;
};

}  // namespace sqlbridge
