// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlbridge::Transaction and sqlbridge::Connection.

#include <catch2/catch_test_macros.hpp>
#include <memory>

#include "fake_session.hpp"
#include "sqlbridge/database.hpp"

using namespace sqlbridge;
using namespace sqlbridge::testing;

// Helper: embedded in-memory database with an emp table
static void OpenSqliteDb(Database* db) {
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Embedded(":memory:");
  cfg.pool.acquisition_timeout = std::chrono::milliseconds(200);
  REQUIRE(db->Open(cfg).ok());
  REQUIRE(db->Execute("CREATE TABLE emp(empno INTEGER PRIMARY KEY, "
                      "empname TEXT NOT NULL);")
              .ok());
}

static int64_t CountEmp(Database* db) {
  QueryResult r;
  REQUIRE(db->QueryPrimary("SELECT count(*) FROM emp;", {}, &r).ok());
  return r.At(0, 0).AsInteger();
}

// Helper: database over fake sessions
static void OpenFakeDb(Database* db, std::shared_ptr<FakeScript> script,
                       QueryObserver* observer = nullptr) {
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Networked("fake-primary");
  cfg.session_factory = FakeFactory(script);
  cfg.retry = QuickRetry(3);
  cfg.observer = observer;
  REQUIRE(db->Open(cfg).ok());
}

TEST_CASE("Transaction: commit makes rows visible", "[transaction]") {
  Database db;
  OpenSqliteDb(&db);
  {
    Error err;
    Transaction tx = db.BeginTransaction(&err);
    REQUIRE(tx.Valid());
    REQUIRE(tx.State() == TransactionState::kActive);
    REQUIRE(tx.Execute("INSERT INTO emp VALUES(?, ?);",
                       {Value::Integer(1), Value::Text("Alice")})
                .ok());
    QueryResult inside;
    REQUIRE(tx.Query("SELECT empname FROM emp;", {}, &inside).ok());
    REQUIRE(inside.NumRows() == 1);
    REQUIRE(tx.Commit().ok());
    REQUIRE(tx.State() == TransactionState::kCommitted);
  }
  REQUIRE(CountEmp(&db) == 1);
}

TEST_CASE("Database: multi-statement string runs nothing",
          "[database]") {
  Database db;
  OpenSqliteDb(&db);
  ExecResult res;
  Error err = db.Execute("INSERT INTO emp VALUES(1, 'Alice'); "
                         "INSERT INTO emp VALUES(2, 'Bob');",
                         {}, &res);
  REQUIRE(err.code == ErrorCode::kMisuse);
  REQUIRE_FALSE(err.Retryable());
  REQUIRE(CountEmp(&db) == 0);

  QueryResult r;
  err = db.Query("SELECT 1; DELETE FROM emp;", {}, &r);
  REQUIRE(err.code == ErrorCode::kMisuse);
}

TEST_CASE("Transaction: dropped while active is rolled back",
          "[transaction]") {
  Database db;
  OpenSqliteDb(&db);
  {
    Transaction tx = db.BeginTransaction();
    REQUIRE(tx.Valid());
    REQUIRE(tx.Execute("INSERT INTO emp VALUES(1, 'Alice');").ok());
  }
  REQUIRE(CountEmp(&db) == 0);
  REQUIRE(db.PrimaryStats().in_use == 0);
}

TEST_CASE("Transaction: double rollback is a no-op", "[transaction]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  OpenFakeDb(&db, script);

  Transaction tx = db.BeginTransaction();
  REQUIRE(tx.Valid());
  REQUIRE(tx.Rollback().ok());
  REQUIRE(tx.Rollback().ok());
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(script->rollbacks == 1);
}

TEST_CASE("Transaction: statements after the end are rejected",
          "[transaction]") {
  Database db;
  OpenSqliteDb(&db);

  Transaction tx = db.BeginTransaction();
  REQUIRE(tx.Commit().ok());

  Error err = tx.Execute("INSERT INTO emp VALUES(1, 'Alice');");
  REQUIRE(err.code == ErrorCode::kTransactionClosed);
  QueryResult r;
  err = tx.Query("SELECT * FROM emp;", {}, &r);
  REQUIRE(err.code == ErrorCode::kTransactionClosed);
  REQUIRE(tx.Commit().code == ErrorCode::kTransactionClosed);
  REQUIRE(tx.Rollback().code == ErrorCode::kTransactionClosed);
  REQUIRE(CountEmp(&db) == 0);
}

TEST_CASE("Transaction: terminal statement error keeps it active",
          "[transaction]") {
  Database db;
  OpenSqliteDb(&db);

  Transaction tx = db.BeginTransaction();
  REQUIRE(tx.Execute("INSERT INTO emp VALUES(1, 'Alice');").ok());
  Error err = tx.Execute("INSERT INTO emp VALUES(1, 'Dup');");
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(tx.State() == TransactionState::kActive);
  REQUIRE(tx.Commit().ok());
  REQUIRE(CountEmp(&db) == 1);
}

TEST_CASE("Transaction: retryable statement error rolls back",
          "[transaction]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kDeadlock));
  Database db;
  OpenFakeDb(&db, script);

  Transaction tx = db.BeginTransaction();
  Error err = tx.Execute("UPDATE t SET x = 1");
  REQUIRE(err.code == ErrorCode::kDeadlock);
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(script->rollbacks == 1);
  // never re-issued on its own
  REQUIRE(script->executes == 1);
}

TEST_CASE("Transaction: connection loss discards the session",
          "[transaction]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kConnectionLost, true));
  Database db;
  OpenFakeDb(&db, script);

  Transaction tx = db.BeginTransaction();
  Error err = tx.Execute("UPDATE t SET x = 1");
  REQUIRE(err.connection_fatal);
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(script->rollbacks == 0);
  REQUIRE(db.PrimaryStats().discarded == 1);
  REQUIRE(script->closes == 1);
}

TEST_CASE("Transaction: failed commit ends rolled back", "[transaction]") {
  auto script = std::make_shared<FakeScript>();
  script->commit_failures.push_back(Fail(ErrorCode::kDeadlock));
  Database db;
  OpenFakeDb(&db, script);

  Transaction tx = db.BeginTransaction();
  REQUIRE(tx.Execute("UPDATE t SET x = 1").ok());
  Error err = tx.Commit();
  REQUIRE(err.code == ErrorCode::kDeadlock);
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(script->rollbacks == 1);
  REQUIRE(tx.Execute("UPDATE t SET x = 2").code ==
          ErrorCode::kTransactionClosed);
}

TEST_CASE("Transaction: observer sees begin and commit", "[transaction]") {
  auto script = std::make_shared<FakeScript>();
  RecordingObserver observer;
  Database db;
  OpenFakeDb(&db, script, &observer);

  Transaction tx = db.BeginTransaction();
  REQUIRE(tx.Execute("UPDATE t SET x = 1").ok());
  REQUIRE(tx.Commit().ok());
  REQUIRE(observer.Count(OperationKind::kBegin) == 1);
  REQUIRE(observer.Count(OperationKind::kExecute) == 1);
  REQUIRE(observer.Count(OperationKind::kCommit) == 1);
}

TEST_CASE("Transaction: cancel abandons the session", "[transaction]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  OpenFakeDb(&db, script);

  Transaction tx = db.BeginTransaction();
  REQUIRE(tx.Execute("UPDATE t SET x = 1").ok());
  tx.Cancel();
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(script->commits == 0);
  REQUIRE(script->rollbacks == 0);
  REQUIRE(db.PrimaryStats().discarded == 1);
  REQUIRE(tx.Execute("UPDATE t SET x = 2").code ==
          ErrorCode::kTransactionClosed);
}

TEST_CASE("Connection: second begin is rejected", "[connection]") {
  Database db;
  OpenSqliteDb(&db);

  Error err;
  std::unique_ptr<Connection> conn = db.Acquire(&err);
  REQUIRE(conn);
  {
    Transaction first = conn->BeginTransaction(&err);
    REQUIRE(first.Valid());
    REQUIRE(conn->InTransaction());

    Transaction second = conn->BeginTransaction(&err);
    REQUIRE_FALSE(second.Valid());
    REQUIRE(err.code == ErrorCode::kAlreadyInTransaction);

    // the first one is untouched
    REQUIRE(first.State() == TransactionState::kActive);
    REQUIRE(first.Execute("INSERT INTO emp VALUES(1, 'Alice');").ok());

    // direct statements are refused while it is open
    err = conn->Execute("INSERT INTO emp VALUES(2, 'Bob');");
    REQUIRE(err.code == ErrorCode::kAlreadyInTransaction);

    REQUIRE(first.Commit().ok());
  }
  REQUIRE_FALSE(conn->InTransaction());
  REQUIRE(conn->Execute("INSERT INTO emp VALUES(2, 'Bob');").ok());
  conn.reset();
  REQUIRE(CountEmp(&db) == 2);
}

TEST_CASE("Connection: parameter count checked before I/O", "[connection]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  OpenFakeDb(&db, script);

  std::unique_ptr<Connection> conn = db.Acquire();
  REQUIRE(conn);
  Error err = conn->Execute("UPDATE t SET a = ? WHERE id = ?",
                            {Value::Integer(1)});
  REQUIRE(err.code == ErrorCode::kParameterCount);
  REQUIRE(script->executes == 0);
}

TEST_CASE("Connection: cancel discards the session", "[connection]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  OpenFakeDb(&db, script);

  std::unique_ptr<Connection> conn = db.Acquire();
  REQUIRE(conn->Execute("UPDATE t SET a = 1").ok());
  conn->Cancel();
  REQUIRE(conn->Cancelled());
  REQUIRE_FALSE(conn->Valid());
  REQUIRE(db.PrimaryStats().discarded == 1);

  Error err = conn->Execute("UPDATE t SET a = 2");
  REQUIRE(err.code == ErrorCode::kShutdown);
  REQUIRE(script->executes == 1);
}

TEST_CASE("Connection: no statements after a connection-level failure",
          "[connection]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kConnectionLost, true));
  Database db;
  OpenFakeDb(&db, script);

  std::unique_ptr<Connection> conn = db.Acquire();
  REQUIRE(conn);
  Error err = conn->Execute("UPDATE t SET a = 1");
  REQUIRE(err.code == ErrorCode::kConnectionLost);
  REQUIRE(err.connection_fatal);
  REQUIRE_FALSE(conn->Valid());
  REQUIRE(db.PrimaryStats().discarded == 1);
  REQUIRE(db.PrimaryStats().in_use == 0);

  err = conn->Execute("UPDATE t SET a = 2");
  REQUIRE(err.code == ErrorCode::kNotOpen);
  REQUIRE(err.connection_fatal);
  QueryResult r;
  REQUIRE(conn->Query("SELECT 1", {}, &r).code == ErrorCode::kNotOpen);
  REQUIRE(script->executes == 1);
  REQUIRE(script->queries == 0);
}
