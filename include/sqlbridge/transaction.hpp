// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Transaction -- scoped unit of work on one connection.
//
// Usage:
//   Error err;
//   Transaction tx = conn->BeginTransaction(&err);
//   if (tx.Valid()) {
//     tx.Execute("UPDATE acct SET bal = bal - 10 WHERE id = ?",
//                {Value::Integer(1)});
//     err = tx.Commit();
//   }   // still Active here -> rolled back
//
// Design:
//   - Active -> Committed | RolledBack; both end states are final
//   - Statements are serialised by an internal mutex and go to the one
//     session the transaction began on
//   - Execute()/Query() in an end state fail with kTransactionClosed
//   - A retryable or connection-level failure rolls the transaction back
//     at once; other failures leave it Active for the caller to decide
//   - A failed Commit() rolls back and ends RolledBack
//   - Rollback() is a no-op once RolledBack
//   - Destroying an Active transaction rolls it back and logs a warning
//   - Statements are never retried individually; re-run the whole unit
//     (Database::RunTransaction does this)
//   - A transaction begun on a borrowed Connection must not outlive it;
//     Database::BeginTransaction() hands out one that owns its connection

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "sqlbridge/connection.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/log.hpp"
#include "sqlbridge/observer.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

enum class TransactionState : uint8_t {
  kActive = 0,
  kCommitted,
  kRolledBack,
};

inline const char* TransactionStateName(TransactionState s) {
  switch (s) {
    case TransactionState::kActive: return "active";
    case TransactionState::kCommitted: return "committed";
    case TransactionState::kRolledBack: return "rolled back";
  }
  return "unknown";
}

class Transaction {
 public:
  Transaction() = default;

  ~Transaction() {
    if (mutex_ == nullptr) { return; }
    std::lock_guard<std::mutex> lock(*mutex_);
    if (state_ == TransactionState::kActive) {
      Log().warn("transaction dropped while active; rolling back");
      Error err = RollbackLocked(true);
      if (!err.ok()) {
        Log().error("safety rollback failed ({}): {}",
                    ErrorCodeName(err.code), err.message);
      }
    }
  }

  // Move
  Transaction(Transaction&& other) noexcept
      : conn_(other.conn_),
        owned_(std::move(other.owned_)),
        mutex_(std::move(other.mutex_)),
        state_(other.state_) {
    other.conn_ = nullptr;
    other.state_ = TransactionState::kRolledBack;
  }

  Transaction& operator=(Transaction&& other) noexcept {
    if (this != &other) {
      Transaction dropped(std::move(*this));
      conn_ = other.conn_;
      owned_ = std::move(other.owned_);
      mutex_ = std::move(other.mutex_);
      state_ = other.state_;
      other.conn_ = nullptr;
      other.state_ = TransactionState::kRolledBack;
    }
    return *this;
  }

  // No copy
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  /// True if this handle came from a successful begin.
  bool Valid() const { return mutex_ != nullptr; }

  TransactionState State() const {
    if (mutex_ == nullptr) { return TransactionState::kRolledBack; }
    std::lock_guard<std::mutex> lock(*mutex_);
    return state_;
  }

  Error Execute(const char* sql, const Params& params = Params{},
                ExecResult* out = nullptr) {
    return Run(OperationKind::kExecute, sql, params, out, nullptr);
  }

  Error Query(const char* sql, const Params& params, QueryResult* out) {
    return Run(OperationKind::kQuery, sql, params, nullptr, out);
  }

  Error Commit() {
    if (mutex_ == nullptr) { return ClosedError(); }
    std::lock_guard<std::mutex> lock(*mutex_);
    if (state_ != TransactionState::kActive) { return ClosedError(); }

    Error err = conn_->Control(OperationKind::kCommit);
    if (err.ok()) {
      CloseLocked(TransactionState::kCommitted);
      return err;
    }
    Log().warn("commit failed ({}), rolling back: {}",
               ErrorCodeName(err.code), err.message);
    Error rb = RollbackLocked(!err.connection_fatal);
    if (!rb.ok()) {
      Log().error("rollback after failed commit failed ({}): {}",
                  ErrorCodeName(rb.code), rb.message);
    }
    return err;
  }

  Error Rollback() {
    if (mutex_ == nullptr) { return Error::Ok(); }
    std::lock_guard<std::mutex> lock(*mutex_);
    if (state_ == TransactionState::kRolledBack) { return Error::Ok(); }
    if (state_ == TransactionState::kCommitted) { return ClosedError(); }
    return RollbackLocked(true);
  }

  /// Abandon the transaction: the session is discarded without issuing
  /// ROLLBACK; the backend drops the uncommitted work with it. Waits for
  /// a running statement. Use Connection::Cancel() to abandon a borrowed
  /// connection while a statement is in flight.
  void Cancel() {
    if (mutex_ == nullptr) { return; }
    std::lock_guard<std::mutex> lock(*mutex_);
    if (state_ != TransactionState::kActive) { return; }
    conn_->Cancel();
    CloseLocked(TransactionState::kRolledBack);
  }

 private:
  friend class Connection;
  friend class Database;

  explicit Transaction(Connection* conn)
      : conn_(conn),
        mutex_(new std::mutex),
        state_(TransactionState::kActive) {}

  void Adopt(std::unique_ptr<Connection> conn) { owned_ = std::move(conn); }

  Error Run(OperationKind op, const char* sql, const Params& params,
            ExecResult* exec_out, QueryResult* query_out) {
    if (mutex_ == nullptr) { return ClosedError(); }
    std::lock_guard<std::mutex> lock(*mutex_);
    if (state_ != TransactionState::kActive) { return ClosedError(); }

    Error err = conn_->Run(op, sql, params, exec_out, query_out, true);
    if (!err.ok() && (err.Retryable() || err.connection_fatal)) {
      Log().warn("transaction aborted by {} ({}); rolling back",
                 ErrorCodeName(err.code), err.message);
      Error rb = RollbackLocked(!err.connection_fatal);
      if (!rb.ok()) {
        Log().error("rollback after abort failed ({}): {}",
                    ErrorCodeName(rb.code), rb.message);
      }
    }
    return err;
  }

  /// Ends RolledBack whatever the outcome. With send == false the
  /// session is already unusable and is discarded instead.
  Error RollbackLocked(bool send) {
    Error err;
    if (send) { err = conn_->Control(OperationKind::kRollback); }
    CloseLocked(TransactionState::kRolledBack);
    return err;
  }

  void CloseLocked(TransactionState end) {
    state_ = end;
    conn_->SetTransactionActive(false);
    conn_ = nullptr;
    owned_.reset();
  }

  static Error ClosedError() {
    return Error::Make(ErrorCode::kTransactionClosed,
                       "transaction is no longer active");
  }

  Connection* conn_ = nullptr;
  std::unique_ptr<Connection> owned_;
  std::unique_ptr<std::mutex> mutex_;
  TransactionState state_ = TransactionState::kRolledBack;
};

// ---------------------------------------------------------------------------
// Connection::BeginTransaction
// ---------------------------------------------------------------------------

inline Transaction Connection::BeginTransaction(Error* out_error) {
  if (read_only_) {
    Report(out_error, ReadOnlyError());
    return Transaction{};
  }
  if (!TryReserveTransaction()) {
    Report(out_error,
           Error::Make(ErrorCode::kAlreadyInTransaction,
                       "connection already has an open transaction"));
    return Transaction{};
  }
  Error err = Control(OperationKind::kBegin);
  if (!err.ok()) {
    SetTransactionActive(false);
    Report(out_error, err);
    return Transaction{};
  }
  return Transaction(this);
}

}  // namespace sqlbridge
