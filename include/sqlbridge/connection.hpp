// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Connection -- caller-facing handle over one leased session.
//
// Usage:
//   Error err;
//   std::unique_ptr<Connection> conn = db.Acquire(&err);
//   if (conn) {
//     conn->Execute("INSERT INTO t VALUES(?)", {Value::Integer(1)});
//   }   // session returns to the pool here
//
// Design:
//   - Holds a PoolLease; destruction hands the session back
//   - The placeholder count is checked before any I/O
//   - Each statement is one attempt reported to the QueryObserver; retry
//     is the Database's job, since it re-acquires a connection
//   - While a Transaction is open, direct Execute()/Query() are rejected
//     with kAlreadyInTransaction; statements go through the Transaction
//   - A connection-level failure hands the session back as broken at
//     once; every later call fails with kNotOpen
//   - A connection leased from a replica is read-only: Execute() and
//     BeginTransaction() fail with kMisuse before any I/O
//   - Cancel() may be called from any thread; the session is discarded
//     as soon as no statement is running on it, and every later call
//     fails with kShutdown
//   - BeginTransaction() is defined in transaction.hpp

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/log.hpp"
#include "sqlbridge/observer.hpp"
#include "sqlbridge/placeholder.hpp"
#include "sqlbridge/pool.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/session.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

class Transaction;

class Connection {
 public:
  Connection(PoolLease lease, QueryObserver* observer, uint32_t attempt = 1,
             bool read_only = false)
      : lease_(std::move(lease)),
        observer_(observer),
        attempt_(attempt),
        read_only_(read_only) {
    if (lease_) { kind_ = lease_->Kind(); }
  }

  ~Connection() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tx_active_ && lease_) {
      Log().error("connection released with an open transaction; "
                  "discarding its session");
      lease_.MarkBroken();
    }
    if (cancelled_.load() && lease_) { lease_.MarkBroken(); }
    lease_.Release();
  }

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  BackendKind Kind() const { return kind_; }

  bool Valid() const { return !cancelled_.load() && static_cast<bool>(lease_); }

  bool Cancelled() const { return cancelled_.load(); }

  /// True when the session belongs to a replica pool.
  bool ReadOnly() const { return read_only_; }

  bool InTransaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tx_active_;
  }

  Error Execute(const char* sql, const Params& params = Params{},
                ExecResult* out = nullptr) {
    return Run(OperationKind::kExecute, sql, params, out, nullptr, false);
  }

  Error Query(const char* sql, const Params& params, QueryResult* out) {
    return Run(OperationKind::kQuery, sql, params, nullptr, out, false);
  }

  inline Transaction BeginTransaction(Error* out_error = nullptr);

  /// Abandon this connection. A running statement is allowed to finish;
  /// the session is then discarded instead of reused.
  void Cancel() {
    if (cancelled_.exchange(true)) { return; }
    Log().info("connection cancelled; session will be discarded");
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (lock.owns_lock()) { DiscardLocked(); }
  }

 private:
  friend class Transaction;
  friend class Database;

  Error Run(OperationKind op, const char* sql, const Params& params,
            ExecResult* exec_out, QueryResult* query_out, bool from_tx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!from_tx && tx_active_) {
      return Error::Make(ErrorCode::kAlreadyInTransaction,
                         "connection has an open transaction; "
                         "use the Transaction handle");
    }
    if (op == OperationKind::kExecute && read_only_) {
      Error ro = ReadOnlyError();
      ro.SetStatement(sql);
      return ro;
    }
    Error err = CheckUsableLocked();
    if (!err.ok()) { return err; }
    err = CheckParameterCount(sql, params.size(), UsesBackslashEscapes(kind_));
    if (!err.ok()) { return err; }

    AttemptTimer timer(observer_, op, kind_, attempt_);
    if (op == OperationKind::kExecute) {
      err = lease_->Execute(sql, params, exec_out);
    } else {
      err = lease_->Query(sql, params, query_out);
    }
    timer.Finish(err);

    if (!err.ok()) {
      if (err.statement[0] == '\0') { err.SetStatement(sql); }
      if (err.connection_fatal) { DiscardLocked(); }
    }
    if (cancelled_.load()) { DiscardLocked(); }
    return err;
  }

  /// Begin / Commit / Rollback on the session.
  Error Control(OperationKind op) {
    std::lock_guard<std::mutex> lock(mutex_);
    Error err = CheckUsableLocked();
    if (!err.ok()) { return err; }

    AttemptTimer timer(observer_, op, kind_, attempt_);
    switch (op) {
      case OperationKind::kBegin: err = lease_->Begin(); break;
      case OperationKind::kCommit: err = lease_->Commit(); break;
      case OperationKind::kRollback: err = lease_->Rollback(); break;
      default:
        err.Set(ErrorCode::kMisuse, "not a transaction control operation");
        break;
    }
    timer.Finish(err);

    if (err.connection_fatal) {
      DiscardLocked();
    } else if (!err.ok() && op == OperationKind::kRollback) {
      // A session whose rollback failed is in an unknown state.
      lease_.MarkBroken();
    }
    if (cancelled_.load()) { DiscardLocked(); }
    return err;
  }

  void SetTransactionActive(bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    tx_active_ = active;
  }

  /// Reserve the transaction slot; false if one is already open.
  bool TryReserveTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tx_active_) { return false; }
    tx_active_ = true;
    return true;
  }

  Error CheckUsableLocked() {
    if (cancelled_.load()) {
      DiscardLocked();
      Error err = Error::Make(ErrorCode::kShutdown, "connection was cancelled");
      err.connection_fatal = true;
      return err;
    }
    if (!lease_) {
      Error err = Error::Make(ErrorCode::kNotOpen, "connection has no session");
      err.connection_fatal = true;
      return err;
    }
    return Error::Ok();
  }

  static Error ReadOnlyError() {
    return Error::Make(ErrorCode::kMisuse,
                       "connection is leased from a replica and is read-only");
  }

  void DiscardLocked() {
    if (lease_) {
      lease_.MarkBroken();
      lease_.Release();
    }
  }

  PoolLease lease_;
  BackendKind kind_ = BackendKind::kEmbedded;
  QueryObserver* observer_;
  uint32_t attempt_;
  bool read_only_;

  mutable std::mutex mutex_;  // one statement at a time
  bool tx_active_ = false;
  std::atomic<bool> cancelled_{false};
};

}  // namespace sqlbridge
