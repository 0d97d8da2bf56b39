// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlbridge::Database.

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "fake_session.hpp"
#include "sqlbridge/database.hpp"

using namespace sqlbridge;
using namespace sqlbridge::testing;

struct Person {
  int64_t empno = 0;
  std::string empname;
};

namespace sqlbridge {
template <>
struct RowTraits<Person> {
  static auto Fields() {
    return std::make_tuple(&Person::empno, &Person::empname);
  }
};
}  // namespace sqlbridge

static DatabaseConfig FakeConfig(std::shared_ptr<FakeScript> script,
                                 QueryObserver* observer = nullptr) {
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Networked("fake-primary");
  cfg.session_factory = FakeFactory(script);
  cfg.retry = QuickRetry(3);
  cfg.observer = observer;
  return cfg;
}

static QueryResult EmpResult() {
  std::vector<Column> cols(2);
  cols[0].name = "empno";
  cols[1].name = "empname";
  QueryResult r(cols);
  r.AddRow({Value::Integer(1), Value::Text("Alice")});
  r.AddRow({Value::Integer(2), Value::Text("Bob")});
  return r;
}

// ---------------------------------------------------------------------------
// Lifecycle / config
// ---------------------------------------------------------------------------

TEST_CASE("Database: open validates the config", "[database]") {
  Database db;
  DatabaseConfig cfg;
  Error err = db.Open(cfg);
  REQUIRE(err.code == ErrorCode::kNullParam);
  REQUIRE_FALSE(db.IsOpen());

  cfg.primary = BackendTarget::Embedded(":memory:");
  cfg.replicas.push_back(BackendTarget::Networked("host:3306:u::d"));
  REQUIRE(db.Open(cfg).code == ErrorCode::kMisuse);

  cfg.replicas.clear();
  cfg.pool.max_connections = 0;
  REQUIRE(db.Open(cfg).code == ErrorCode::kRange);
}

TEST_CASE("Database: open is lazy", "[database]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());
  REQUIRE(db.IsOpen());
  REQUIRE(db.Kind() == BackendKind::kNetworked);
  REQUIRE(script->opens == 0);
  REQUIRE(db.Open(FakeConfig(script)).code == ErrorCode::kMisuse);
}

TEST_CASE("Database: calls on a closed database fail", "[database]") {
  Database db;
  REQUIRE(db.Execute("SELECT 1").code == ErrorCode::kNotOpen);
  REQUIRE(db.Acquire() == nullptr);
  REQUIRE_FALSE(db.BeginTransaction().Valid());
}

// ---------------------------------------------------------------------------
// Statements / retry
// ---------------------------------------------------------------------------

TEST_CASE("Database: parameter mismatch makes no round trip", "[database]") {
  auto script = std::make_shared<FakeScript>();
  RecordingObserver observer;
  Database db;
  REQUIRE(db.Open(FakeConfig(script, &observer)).ok());

  Error err = db.Execute("INSERT INTO t VALUES(?, ?)", {Value::Integer(1)});
  REQUIRE(err.code == ErrorCode::kParameterCount);
  REQUIRE(err.index == 2);
  QueryResult r;
  err = db.Query("SELECT * FROM t", {Value::Integer(1)}, &r);
  REQUIRE(err.code == ErrorCode::kParameterCount);

  REQUIRE(script->opens == 0);
  REQUIRE(script->executes == 0);
  REQUIRE(script->queries == 0);
  REQUIRE(observer.Events().empty());
}

TEST_CASE("Database: execute returns affected rows", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->exec_result = ExecResult{3, 42};
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  ExecResult res;
  Error err = db.Execute("UPDATE t SET x = ?", {Value::Integer(1)}, &res);
  REQUIRE(err.ok());
  REQUIRE(err.attempts == 1);
  REQUIRE(res.affected_rows == 3);
  REQUIRE(res.last_insert_id == 42);
}

TEST_CASE("Database: transient failures are retried", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kDeadlock));
  script->execute_failures.push_back(Fail(ErrorCode::kLockTimeout));
  RecordingObserver observer;
  Database db;
  REQUIRE(db.Open(FakeConfig(script, &observer)).ok());

  Error err = db.Execute("UPDATE t SET x = 1");
  REQUIRE(err.ok());
  REQUIRE(err.attempts == 3);
  REQUIRE(script->executes == 3);

  std::vector<QueryEvent> events = observer.Events();
  REQUIRE(events.size() == 3);
  REQUIRE_FALSE(events[0].success);
  REQUIRE(events[0].code == ErrorCode::kDeadlock);
  REQUIRE(events[0].attempt == 1);
  REQUIRE(events[1].attempt == 2);
  REQUIRE(events[2].success);
  REQUIRE(events[2].attempt == 3);
  REQUIRE(events[2].backend == BackendKind::kNetworked);
}

TEST_CASE("Database: retries stop at max_attempts", "[database]") {
  auto script = std::make_shared<FakeScript>();
  for (int i = 0; i < 5; ++i) {
    script->execute_failures.push_back(Fail(ErrorCode::kDeadlock));
  }
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  Error err = db.Execute("UPDATE t SET x = 1");
  REQUIRE(err.code == ErrorCode::kDeadlock);
  REQUIRE(err.attempts == 3);
  REQUIRE(script->executes == 3);
}

TEST_CASE("Database: terminal failures surface at once", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kConstraint));
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  Error err = db.Execute("INSERT INTO t VALUES(1)");
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(err.attempts == 1);
  REQUIRE(std::string(err.statement) == "INSERT INTO t VALUES(1)");
}

TEST_CASE("Database: per-call retry policy", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kDeadlock));
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  RetryPolicy once = RetryPolicy::NoRetry();
  Error err = db.Execute("UPDATE t SET x = 1", {}, nullptr, &once);
  REQUIRE(err.code == ErrorCode::kDeadlock);
  REQUIRE(err.attempts == 1);
}

TEST_CASE("Database: lost connection is discarded and retried",
          "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Fail(ErrorCode::kConnectionLost, true));
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  REQUIRE(db.Execute("UPDATE t SET x = 1").ok());
  REQUIRE(script->opens == 2);
  Pool::Stats s = db.PrimaryStats();
  REQUIRE(s.discarded == 1);
  REQUIRE(s.idle == 1);
}

TEST_CASE("Database: unreachable backend is retried", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->open_failures.push_back(Fail(ErrorCode::kConnectionLost, true));
  RecordingObserver observer;
  Database db;
  REQUIRE(db.Open(FakeConfig(script, &observer)).ok());

  REQUIRE(db.Execute("UPDATE t SET x = 1").ok());
  REQUIRE(observer.Events().size() == 2);
  REQUIRE(observer.Events()[0].code == ErrorCode::kConnectionLost);
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

TEST_CASE("Database: reads go to replicas round-robin", "[database]") {
  auto script = std::make_shared<FakeScript>();
  DatabaseConfig cfg = FakeConfig(script);
  cfg.replicas.push_back(BackendTarget::Networked("fake-replica-0"));
  cfg.replicas.push_back(BackendTarget::Networked("fake-replica-1"));
  Database db;
  REQUIRE(db.Open(cfg).ok());

  QueryResult r;
  for (int i = 0; i < 4; ++i) {
    REQUIRE(db.Query("SELECT 1", {}, &r).ok());
  }
  REQUIRE(db.QueryPrimary("SELECT 1", {}, &r).ok());

  std::vector<std::string> targets = script->query_targets;
  REQUIRE(targets.size() == 5);
  REQUIRE(targets[0] != targets[1]);
  REQUIRE(targets[0] == targets[2]);
  REQUIRE(targets[1] == targets[3]);
  REQUIRE(targets[0].find("replica") != std::string::npos);
  REQUIRE(targets[4] == "fake-primary");
  REQUIRE(db.ReplicaStats().size() == 2);
}

TEST_CASE("Database: transactions and writes stay on the primary",
          "[database]") {
  auto script = std::make_shared<FakeScript>();
  DatabaseConfig cfg = FakeConfig(script);
  cfg.replicas.push_back(BackendTarget::Networked("fake-replica-0"));
  Database db;
  REQUIRE(db.Open(cfg).ok());

  REQUIRE(db.Execute("UPDATE t SET a = 1").ok());
  Error err = db.RunTransaction([](Transaction& tx) {
    QueryResult r;
    return tx.Query("SELECT a FROM t", {}, &r);
  });
  REQUIRE(err.ok());
  {
    Transaction tx = db.BeginTransaction(&err);
    REQUIRE(tx.Valid());
    QueryResult r;
    REQUIRE(tx.Query("SELECT a FROM t", {}, &r).ok());
    REQUIRE(tx.Commit().ok());
  }

  REQUIRE(script->query_targets.size() == 2);
  REQUIRE(script->query_targets[0] == "fake-primary");
  REQUIRE(script->query_targets[1] == "fake-primary");
  REQUIRE(db.ReplicaStats()[0].created == 0);
}

TEST_CASE("Database: replica connections are read-only", "[database]") {
  auto script = std::make_shared<FakeScript>();
  DatabaseConfig cfg = FakeConfig(script);
  cfg.replicas.push_back(BackendTarget::Networked("fake-replica-0"));
  Database db;
  REQUIRE(db.Open(cfg).ok());

  Error err;
  std::unique_ptr<Connection> conn = db.Acquire(&err, Route::kReplica);
  REQUIRE(conn);
  REQUIRE(conn->ReadOnly());

  err = conn->Execute("DELETE FROM t");
  REQUIRE(err.code == ErrorCode::kMisuse);
  REQUIRE(script->executes == 0);

  Transaction tx = conn->BeginTransaction(&err);
  REQUIRE_FALSE(tx.Valid());
  REQUIRE(err.code == ErrorCode::kMisuse);
  REQUIRE(script->begins == 0);
  REQUIRE_FALSE(conn->InTransaction());

  QueryResult r;
  REQUIRE(conn->Query("SELECT 1", {}, &r).ok());
  REQUIRE(script->query_targets.back() == "fake-replica-0");
  conn.reset();

  // Without replicas the same route falls back to a writable primary.
  auto plain = std::make_shared<FakeScript>();
  Database primary_only;
  REQUIRE(primary_only.Open(FakeConfig(plain)).ok());
  conn = primary_only.Acquire(&err, Route::kReplica);
  REQUIRE(conn);
  REQUIRE_FALSE(conn->ReadOnly());
  REQUIRE(conn->Execute("DELETE FROM t").ok());
  conn.reset();
}

TEST_CASE("Database: reads use the primary without replicas",
          "[database]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  QueryResult r;
  REQUIRE(db.Query("SELECT 1", {}, &r).ok());
  REQUIRE(script->query_targets.size() == 1);
  REQUIRE(script->query_targets[0] == "fake-primary");
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

TEST_CASE("Database: QueryAs maps rows", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->result = EmpResult();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  std::vector<Person> emps;
  REQUIRE(db.QueryAs("SELECT empno, empname FROM emp", {}, &emps).ok());
  REQUIRE(emps.size() == 2);
  REQUIRE(emps[1].empname == "Bob");
}

TEST_CASE("Database: failed query leaves the result untouched",
          "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->query_failures.push_back(Fail(ErrorCode::kSyntax));
  script->result = EmpResult();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  QueryResult r = EmpResult();
  Error err = db.Query("SELEC 1", {}, &r);
  REQUIRE(err.code == ErrorCode::kSyntax);
  REQUIRE(r.NumRows() == 2);
}

// ---------------------------------------------------------------------------
// Async
// ---------------------------------------------------------------------------

TEST_CASE("Database: async execute and query", "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->result = EmpResult();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  std::vector<std::future<ExecOutcome>> writes;
  for (int i = 0; i < 10; ++i) {
    writes.push_back(db.ExecuteAsync("INSERT INTO t VALUES(?)",
                                     {Value::Integer(i)}));
  }
  std::future<QueryOutcome> read = db.QueryAsync("SELECT * FROM emp");

  for (auto& f : writes) {
    ExecOutcome out = f.get();
    REQUIRE(out.error.ok());
    REQUIRE(out.result.affected_rows == 1);
  }
  QueryOutcome q = read.get();
  REQUIRE(q.error.ok());
  REQUIRE(q.result.NumRows() == 2);
  REQUIRE(script->executes == 10);
}

TEST_CASE("Database: async errors come through the future", "[database]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  ExecOutcome out = db.ExecuteAsync("INSERT INTO t VALUES(?)").get();
  REQUIRE(out.error.code == ErrorCode::kParameterCount);
}

TEST_CASE("Database: async after close is refused", "[database]") {
  auto script = std::make_shared<FakeScript>();
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());
  db.Close();

  ExecOutcome out = db.ExecuteAsync("UPDATE t SET x = 1").get();
  REQUIRE(out.error.code == ErrorCode::kShutdown);
  QueryOutcome q = db.QueryAsync("SELECT 1").get();
  REQUIRE(q.error.code == ErrorCode::kShutdown);
}

TEST_CASE("Database: embedded async runs on one dedicated thread",
          "[database]") {
  Database db;
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Embedded(":memory:");
  REQUIRE(db.Open(cfg).ok());
  REQUIRE(db.Execute("CREATE TABLE t(id INTEGER);").ok());

  std::vector<std::future<ExecOutcome>> writes;
  for (int i = 0; i < 20; ++i) {
    writes.push_back(
        db.ExecuteAsync("INSERT INTO t VALUES(?);", {Value::Integer(i)}));
  }
  for (auto& f : writes) { REQUIRE(f.get().error.ok()); }

  QueryOutcome q = db.QueryAsync("SELECT count(*) FROM t;").get();
  REQUIRE(q.error.ok());
  REQUIRE(q.result.At(0, 0).AsInteger() == 20);
  REQUIRE(db.PrimaryStats().created == 1);
}

// ---------------------------------------------------------------------------
// RunTransaction
// ---------------------------------------------------------------------------

TEST_CASE("Database: RunTransaction commits", "[database]") {
  Database db;
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Embedded(":memory:");
  REQUIRE(db.Open(cfg).ok());
  REQUIRE(db.Execute("CREATE TABLE acct(id INTEGER, bal INTEGER);").ok());
  REQUIRE(db.Execute("INSERT INTO acct VALUES(1, 100), (2, 0);").ok());

  Error err = db.RunTransaction([](Transaction& tx) {
    Error e = tx.Execute("UPDATE acct SET bal = bal - 30 WHERE id = 1;");
    if (!e.ok()) { return e; }
    return tx.Execute("UPDATE acct SET bal = bal + 30 WHERE id = 2;");
  });
  REQUIRE(err.ok());

  QueryResult r;
  REQUIRE(db.QueryPrimary("SELECT bal FROM acct ORDER BY id;", {}, &r).ok());
  REQUIRE(r.At(0, 0).AsInteger() == 70);
  REQUIRE(r.At(1, 0).AsInteger() == 30);
}

TEST_CASE("Database: RunTransaction body error rolls back", "[database]") {
  Database db;
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Embedded(":memory:");
  REQUIRE(db.Open(cfg).ok());
  REQUIRE(db.Execute("CREATE TABLE t(id INTEGER);").ok());

  int runs = 0;
  Error err = db.RunTransaction([&runs](Transaction& tx) {
    ++runs;
    Error e = tx.Execute("INSERT INTO t VALUES(1);");
    if (!e.ok()) { return e; }
    return Error::Make(ErrorCode::kError, "business rule failed");
  });
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(runs == 1);

  QueryResult r;
  REQUIRE(db.QueryPrimary("SELECT count(*) FROM t;", {}, &r).ok());
  REQUIRE(r.At(0, 0).AsInteger() == 0);
}

TEST_CASE("Database: RunTransaction re-runs the whole unit on deadlock",
          "[database]") {
  auto script = std::make_shared<FakeScript>();
  script->execute_failures.push_back(Error::Ok());
  script->execute_failures.push_back(Fail(ErrorCode::kDeadlock));
  Database db;
  REQUIRE(db.Open(FakeConfig(script)).ok());

  int runs = 0;
  Error err = db.RunTransaction([&runs](Transaction& tx) {
    ++runs;
    Error e = tx.Execute("UPDATE a SET x = x - 1");
    if (!e.ok()) { return e; }
    return tx.Execute("UPDATE b SET x = x + 1");
  });
  REQUIRE(err.ok());
  REQUIRE(err.attempts == 2);
  REQUIRE(runs == 2);
  REQUIRE(script->begins == 2);
  REQUIRE(script->rollbacks == 1);
  REQUIRE(script->commits == 1);
  REQUIRE(script->executes == 4);
}
