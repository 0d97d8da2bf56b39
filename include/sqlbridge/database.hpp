// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Database -- unified entry point over a primary and optional
// read replicas of one backend kind.
//
// Usage (SQLite3):
//   DatabaseConfig cfg;
//   cfg.primary = BackendTarget::Embedded("app.db");
//   Database db;
//   Error err = db.Open(cfg);
//   err = db.Execute("INSERT INTO emp VALUES(?, ?)",
//                    {Value::Integer(7), Value::Text("Ann")});
//   QueryResult rows;
//   err = db.Query("SELECT * FROM emp", {}, &rows);
//
// Usage (MariaDB/MySQL, requires SQLBRIDGE_HAS_MARIADB=1):
//   cfg.primary = BackendTarget::Networked("localhost:3306:root:pass:app");
//   cfg.replicas.push_back(BackendTarget::Networked("replica1:3306:ro::app"));
//
// Design:
//   - One Pool per target; sessions are opened lazily on first use
//   - Execute() and QueryPrimary() go to the primary; Query() goes to the
//     replicas round-robin, or the primary when there are none
//   - Parameter count is checked before any connection is leased
//   - Each call is retried per RetryPolicy (config default or per call),
//     leasing a fresh connection for every attempt; the observer sees
//     each attempt once
//   - Async calls return std::future and run on an Executor: a pool of
//     worker_threads for the networked backend, one dedicated thread for
//     the embedded engine
//   - Close() lets queued async work finish, then drains the pools; all
//     Connections and Transactions must be released first
//   - An embedded Database has a single session: holding a Connection or
//     Transaction while calling Execute()/Query() on the same Database
//     from the same thread waits for the acquisition timeout

#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlbridge/config.hpp"
#include "sqlbridge/connection.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/executor.hpp"
#include "sqlbridge/log.hpp"
#include "sqlbridge/observer.hpp"
#include "sqlbridge/placeholder.hpp"
#include "sqlbridge/pool.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/retry.hpp"
#include "sqlbridge/row_mapper.hpp"
#include "sqlbridge/session.hpp"
#include "sqlbridge/sqlite3_session.hpp"
#include "sqlbridge/transaction.hpp"
#include "sqlbridge/value.hpp"

#if defined(SQLBRIDGE_HAS_MARIADB) && SQLBRIDGE_HAS_MARIADB
#include "sqlbridge/maria_session.hpp"
#endif

namespace sqlbridge {

enum class Route : uint8_t {
  kPrimary = 0,
  kReplica,
};

struct ExecOutcome {
  Error error;
  ExecResult result;
};

struct QueryOutcome {
  Error error;
  QueryResult result;
};

/// Built-in sessions: Sqlite3Session for embedded targets, MariaSession
/// for networked ones when compiled in.
inline SessionFactory DefaultSessionFactory(int32_t busy_timeout_ms) {
  return [busy_timeout_ms](const BackendTarget& target,
                           Error* out_error) -> std::unique_ptr<Session> {
    if (target.kind == BackendKind::kEmbedded) {
      return Sqlite3Session::Open(target, busy_timeout_ms, out_error);
    }
#if defined(SQLBRIDGE_HAS_MARIADB) && SQLBRIDGE_HAS_MARIADB
    return MariaSession::Open(target, busy_timeout_ms, out_error);
#else
    Report(out_error,
           Error::Make(ErrorCode::kMisuse,
                       "networked backend not compiled in "
                       "(SQLBRIDGE_HAS_MARIADB=0)"));
    return nullptr;
#endif
  };
}

class Database {
 public:
  Database() = default;

  ~Database() { Close(); }

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // --- Lifecycle ---

  Error Open(DatabaseConfig config) {
    if (open_) {
      return Error::Make(ErrorCode::kMisuse, "Database already open");
    }
    Error err = config.Validate();
    if (!err.ok()) { return err; }

    config_ = std::move(config);
    if (!config_.session_factory) {
      config_.session_factory = DefaultSessionFactory(config_.busy_timeout_ms);
    }
    kind_ = config_.primary.kind;

    primary_ = MakePool(config_.primary, "primary");
    for (size_t i = 0; i < config_.replicas.size(); ++i) {
      replicas_.push_back(
          MakePool(config_.replicas[i], "replica-" + std::to_string(i)));
    }
    if (kind_ == BackendKind::kEmbedded) {
      executor_.reset(new Executor(1, "sqlbridge-embedded"));
    } else {
      executor_.reset(new Executor(config_.worker_threads, "sqlbridge-net"));
    }
    open_ = true;
    Log().info("database open: {} backend, {} replica(s)",
               BackendKindName(kind_), replicas_.size());
    return Error::Ok();
  }

  void Close() {
    if (!open_) { return; }
    executor_->Shutdown();
    for (auto& pool : replicas_) { pool->Drain(); }
    primary_->Drain();
    executor_.reset();
    replicas_.clear();
    primary_.reset();
    open_ = false;
    Log().info("database closed");
  }

  bool IsOpen() const { return open_; }
  BackendKind Kind() const { return kind_; }

  // --- Statements ---

  Error Execute(const char* sql, const Params& params = Params{},
                ExecResult* out = nullptr,
                const RetryPolicy* policy = nullptr) {
    return RunStatement(Route::kPrimary, OperationKind::kExecute, sql, params,
                        out, nullptr, policy);
  }

  /// Read from a replica (round-robin) or the primary if there are none.
  Error Query(const char* sql, const Params& params, QueryResult* out,
              const RetryPolicy* policy = nullptr) {
    return RunStatement(Route::kReplica, OperationKind::kQuery, sql, params,
                        nullptr, out, policy);
  }

  /// Read from the primary, e.g. to see a write just made.
  Error QueryPrimary(const char* sql, const Params& params, QueryResult* out,
                     const RetryPolicy* policy = nullptr) {
    return RunStatement(Route::kPrimary, OperationKind::kQuery, sql, params,
                        nullptr, out, policy);
  }

  /// Query() then map every row into T (see row_mapper.hpp).
  template <typename T>
  Error QueryAs(const char* sql, const Params& params, std::vector<T>* out,
                const RetryPolicy* policy = nullptr) {
    QueryResult result;
    Error err = Query(sql, params, &result, policy);
    if (!err.ok()) { return err; }
    err = MapRows(result, out);
    if (!err.ok()) { err.SetStatement(sql); }
    return err;
  }

  // --- Async ---

  std::future<ExecOutcome> ExecuteAsync(std::string sql,
                                        Params params = Params{},
                                        const RetryPolicy* policy = nullptr) {
    auto promise = std::make_shared<std::promise<ExecOutcome>>();
    std::future<ExecOutcome> future = promise->get_future();
    RetryPolicy p = policy != nullptr ? *policy : config_.retry;
    bool posted =
        open_ && executor_->Post([this, promise, sql, params, p]() {
          ExecOutcome outcome;
          outcome.error = Execute(sql.c_str(), params, &outcome.result, &p);
          promise->set_value(std::move(outcome));
        });
    if (!posted) {
      ExecOutcome outcome;
      outcome.error = NotAcceptingError();
      promise->set_value(std::move(outcome));
    }
    return future;
  }

  std::future<QueryOutcome> QueryAsync(std::string sql,
                                       Params params = Params{},
                                       Route route = Route::kReplica,
                                       const RetryPolicy* policy = nullptr) {
    auto promise = std::make_shared<std::promise<QueryOutcome>>();
    std::future<QueryOutcome> future = promise->get_future();
    RetryPolicy p = policy != nullptr ? *policy : config_.retry;
    bool posted =
        open_ && executor_->Post([this, promise, sql, params, route, p]() {
          QueryOutcome outcome;
          outcome.error = RunStatement(route, OperationKind::kQuery,
                                       sql.c_str(), params, nullptr,
                                       &outcome.result, &p);
          promise->set_value(std::move(outcome));
        });
    if (!posted) {
      QueryOutcome outcome;
      outcome.error = NotAcceptingError();
      promise->set_value(std::move(outcome));
    }
    return future;
  }

  // --- Connections / transactions ---

  /// Lease a connection for several statements. Single attempt.
  /// Route::kReplica yields a read-only connection when replicas exist;
  /// writes and transactions need a primary one.
  std::unique_ptr<Connection> Acquire(Error* out_error = nullptr,
                                      Route route = Route::kPrimary) {
    if (!open_) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database not open"));
      return nullptr;
    }
    bool replica = false;
    PoolLease lease = PickPool(route, &replica)->Acquire(out_error);
    if (!lease) { return nullptr; }
    return std::unique_ptr<Connection>(
        new Connection(std::move(lease), config_.observer, 1, replica));
  }

  /// Begin a transaction on a primary connection the transaction owns.
  Transaction BeginTransaction(Error* out_error = nullptr) {
    return BeginOwnedTransaction(1, out_error);
  }

  /// Run body(Transaction&) -> Error inside a transaction and commit it.
  /// A body error rolls back. When the failure is retryable the whole
  /// unit, body included, is run again per the retry policy.
  template <typename Fn>
  Error RunTransaction(Fn&& body, const RetryPolicy* policy = nullptr) {
    if (!open_) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    const RetryPolicy& p = policy != nullptr ? *policy : config_.retry;
    return RunWithRetry(p, "transaction", [&](uint32_t attempt) {
      Error err;
      Transaction tx = BeginOwnedTransaction(attempt, &err);
      if (!tx.Valid()) { return err; }
      err = body(tx);
      if (!err.ok()) {
        Error rb = tx.Rollback();
        if (!rb.ok()) {
          Log().warn("rollback after failed transaction body failed "
                     "({}): {}", ErrorCodeName(rb.code), rb.message);
        }
        return err;
      }
      switch (tx.State()) {
        case TransactionState::kActive: return tx.Commit();
        case TransactionState::kCommitted: return Error::Ok();
        case TransactionState::kRolledBack: break;
      }
      return Error::Make(ErrorCode::kTransactionClosed,
                         "transaction was rolled back inside the body");
    });
  }

  // --- Stats ---

  Pool::Stats PrimaryStats() const {
    return primary_ != nullptr ? primary_->GetStats() : Pool::Stats{};
  }

  std::vector<Pool::Stats> ReplicaStats() const {
    std::vector<Pool::Stats> out;
    for (const auto& pool : replicas_) { out.push_back(pool->GetStats()); }
    return out;
  }

 private:
  std::unique_ptr<Pool> MakePool(const BackendTarget& target,
                                 const std::string& name) {
    SessionFactory factory = config_.session_factory;
    return std::unique_ptr<Pool>(new Pool(
        target.kind, config_.pool,
        [factory, target](Error* out_error) {
          return factory(target, out_error);
        },
        name));
  }

  Pool* PickPool(Route route, bool* replica) {
    *replica = route == Route::kReplica && !replicas_.empty();
    if (*replica) {
      uint32_t i = next_replica_.fetch_add(1, std::memory_order_relaxed);
      return replicas_[i % replicas_.size()].get();
    }
    return primary_.get();
  }

  Error RunStatement(Route route, OperationKind op, const char* sql,
                     const Params& params, ExecResult* exec_out,
                     QueryResult* query_out, const RetryPolicy* policy) {
    if (!open_) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    Error err =
        CheckParameterCount(sql, params.size(), UsesBackslashEscapes(kind_));
    if (!err.ok()) { return err; }

    const RetryPolicy& p = policy != nullptr ? *policy : config_.retry;
    return RunWithRetry(p, OperationKindName(op), [&](uint32_t attempt) {
      AttemptTimer acquire_timer(config_.observer, op, kind_, attempt);
      Error attempt_err;
      bool replica = false;
      PoolLease lease = PickPool(route, &replica)->Acquire(&attempt_err);
      if (!lease) {
        acquire_timer.Finish(attempt_err);
        return attempt_err;
      }
      Connection conn(std::move(lease), config_.observer, attempt, replica);
      if (op == OperationKind::kExecute) {
        return conn.Execute(sql, params, exec_out);
      }
      return conn.Query(sql, params, query_out);
    });
  }

  Transaction BeginOwnedTransaction(uint32_t attempt, Error* out_error) {
    if (!open_) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database not open"));
      return Transaction{};
    }
    AttemptTimer acquire_timer(config_.observer, OperationKind::kBegin, kind_,
                               attempt);
    Error err;
    PoolLease lease = primary_->Acquire(&err);
    if (!lease) {
      acquire_timer.Finish(err);
      Report(out_error, err);
      return Transaction{};
    }
    std::unique_ptr<Connection> conn(
        new Connection(std::move(lease), config_.observer, attempt));
    Transaction tx = conn->BeginTransaction(out_error);
    if (tx.Valid()) { tx.Adopt(std::move(conn)); }
    return tx;
  }

  static Error NotAcceptingError() {
    return Error::Make(ErrorCode::kShutdown,
                       "Database closed or shutting down");
  }

  DatabaseConfig config_;
  BackendKind kind_ = BackendKind::kEmbedded;
  std::unique_ptr<Pool> primary_;
  std::vector<std::unique_ptr<Pool>> replicas_;
  std::atomic<uint32_t> next_replica_{0};
  std::unique_ptr<Executor> executor_;
  bool open_ = false;
};

}  // namespace sqlbridge
