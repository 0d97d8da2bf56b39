// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge MariaDB demo -- pooled primary with an optional read replica.
//
// Usage:
//   export SQLBRIDGE_MARIA_DSN="localhost:3306:root:pass:sqlbridge_test"
//   export SQLBRIDGE_MARIA_REPLICA_DSN="replica:3306:ro:pass:sqlbridge_test"
//   ./sqlbridge_mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS sqlbridge_test;"

#include <cstdio>
#include <cstdlib>
#include <future>
#include <vector>

#include "sqlbridge/database.hpp"

using namespace sqlbridge;

static void PrintError(const char* what, const Error& err) {
  std::fprintf(stderr, "%s failed: [%s/%d] %s (attempts %d)\n", what,
               ErrorCodeName(err.code), err.native_code, err.message,
               err.attempts);
}

int main() {
  const char* dsn = std::getenv("SQLBRIDGE_MARIA_DSN");
  if (dsn == nullptr) { dsn = "localhost:3306:root::sqlbridge_test"; }
  const char* replica = std::getenv("SQLBRIDGE_MARIA_REPLICA_DSN");

  LoggingObserver observer;
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Networked(dsn);
  if (replica != nullptr) {
    cfg.replicas.push_back(BackendTarget::Networked(replica));
  }
  cfg.pool.max_connections = 4;
  cfg.observer = &observer;

  Database db;
  Error err = db.Open(cfg);
  if (!err.ok()) {
    PrintError("Open", err);
    return 1;
  }

  err = db.Execute("DROP TABLE IF EXISTS emp;");
  if (err.ok()) {
    err = db.Execute("CREATE TABLE emp(empno INT PRIMARY KEY, "
                     "empname VARCHAR(64), salary DOUBLE);");
  }
  if (!err.ok()) {
    PrintError("Create", err);
    return 1;
  }
  std::printf("Connected, emp table ready\n");

  // Concurrent inserts through the worker pool
  std::vector<std::future<ExecOutcome>> pending;
  for (int64_t i = 1; i <= 8; ++i) {
    pending.push_back(db.ExecuteAsync(
        "INSERT INTO emp VALUES(?, ?, ?);",
        {Value::Integer(i), Value::Text("Employee"),
         Value::Float(1000.0 * static_cast<double>(i))}));
  }
  for (auto& f : pending) {
    ExecOutcome out = f.get();
    if (!out.error.ok()) { PrintError("Insert", out.error); }
  }

  // Duplicate key: terminal, surfaced on the first attempt
  err = db.Execute("INSERT INTO emp VALUES(?, ?, ?);",
                   {Value::Integer(1), Value::Text("Dup"), Value::Null()});
  PrintError("Duplicate insert (expected)", err);

  // Transfer inside a transaction
  err = db.RunTransaction([](Transaction& tx) {
    Error e = tx.Execute("UPDATE emp SET salary = salary - ? WHERE empno = ?;",
                         {Value::Float(100.0), Value::Integer(8)});
    if (!e.ok()) { return e; }
    return tx.Execute("UPDATE emp SET salary = salary + ? WHERE empno = ?;",
                      {Value::Float(100.0), Value::Integer(1)});
  });
  if (!err.ok()) { PrintError("Transfer", err); }

  // Read-after-write goes to the primary
  QueryResult rows;
  err = db.QueryPrimary("SELECT empno, salary FROM emp ORDER BY empno;", {},
                        &rows);
  if (!err.ok()) {
    PrintError("Query", err);
    return 1;
  }
  for (const Row& row : rows) {
    std::printf("  empno=%lld  salary=%.2f\n",
                static_cast<long long>(row[0].AsInteger()), row[1].AsFloat());
  }

  Pool::Stats s = db.PrimaryStats();
  std::printf("primary pool: idle=%u in_use=%u created=%llu\n", s.idle,
              s.in_use, static_cast<unsigned long long>(s.created));

  db.Close();
  std::printf("Done.\n");
  return 0;
}
