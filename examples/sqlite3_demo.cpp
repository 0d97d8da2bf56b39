// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge SQLite3 demo -- CRUD, transactions and async calls on the
// embedded backend.
//
// Usage:
//   ./sqlbridge_sqlite3_demo [path]     (default ":memory:")

#include <cstdio>
#include <future>
#include <string>
#include <vector>

#include "sqlbridge/database.hpp"

using namespace sqlbridge;

struct Emp {
  int64_t empno = 0;
  std::string empname;
};

namespace sqlbridge {
template <>
struct RowTraits<Emp> {
  static auto Fields() { return std::make_tuple(&Emp::empno, &Emp::empname); }
};
}  // namespace sqlbridge

static void PrintError(const char* what, const Error& err) {
  std::fprintf(stderr, "%s failed: [%s] %s\n", what, ErrorCodeName(err.code),
               err.message);
}

int main(int argc, char** argv) {
  StatsObserver stats;
  DatabaseConfig cfg;
  cfg.primary = BackendTarget::Embedded(argc > 1 ? argv[1] : ":memory:");
  cfg.observer = &stats;

  Database db;
  Error err = db.Open(cfg);
  if (!err.ok()) {
    PrintError("Open", err);
    return 1;
  }

  err = db.Execute("CREATE TABLE IF NOT EXISTS emp(empno INTEGER PRIMARY KEY, "
                   "empname TEXT NOT NULL);");
  if (!err.ok()) {
    PrintError("Create", err);
    return 1;
  }

  // Insert with parameters
  const char* names[] = {"Alice", "Bob", "Charlie"};
  for (int64_t i = 0; i < 3; ++i) {
    ExecResult res;
    err = db.Execute("INSERT INTO emp(empname) VALUES(?);",
                     {Value::Text(names[i])}, &res);
    if (!err.ok()) {
      PrintError("Insert", err);
      return 1;
    }
    std::printf("Inserted %s as empno %lld\n", names[i],
                static_cast<long long>(res.last_insert_id));
  }

  // Query into records
  std::printf("\n--- Query ---\n");
  std::vector<Emp> emps;
  err = db.QueryAs("SELECT empno, empname FROM emp ORDER BY empno;", {},
                   &emps);
  if (!err.ok()) {
    PrintError("Query", err);
    return 1;
  }
  for (const Emp& e : emps) {
    std::printf("  empno=%lld  empname=%s\n",
                static_cast<long long>(e.empno), e.empname.c_str());
  }

  // Transaction that commits
  std::printf("\n--- Transaction ---\n");
  err = db.RunTransaction([](Transaction& tx) {
    Error e = tx.Execute("UPDATE emp SET empname = ? WHERE empno = ?;",
                         {Value::Text("Boss"), Value::Integer(1)});
    if (!e.ok()) { return e; }
    return tx.Execute("DELETE FROM emp WHERE empname = ?;",
                      {Value::Text("Charlie")});
  });
  std::printf("Committed: %s\n", err.ok() ? "yes" : err.message);

  // Transaction dropped without commit
  {
    Transaction tx = db.BeginTransaction(&err);
    if (tx.Valid()) {
      err = tx.Execute("DELETE FROM emp;");
      std::printf("Deleted everything inside a transaction: %s\n",
                  err.ok() ? "ok" : err.message);
    }
  }  // rolled back here

  // Async batch on the embedded executor
  std::printf("\n--- Async batch ---\n");
  std::vector<std::future<ExecOutcome>> pending;
  for (int64_t i = 0; i < 10; ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "Employee%02lld",
                  static_cast<long long>(i));
    pending.push_back(db.ExecuteAsync("INSERT INTO emp(empname) VALUES(?);",
                                      {Value::Text(name)}));
  }
  int ok_count = 0;
  for (auto& f : pending) {
    ExecOutcome out = f.get();
    if (out.error.ok()) { ++ok_count; }
  }
  std::printf("Async inserts succeeded: %d\n", ok_count);

  QueryResult count;
  err = db.QueryPrimary("SELECT count(*) FROM emp;", {}, &count);
  if (err.ok()) {
    std::printf("Row count: %lld\n",
                static_cast<long long>(count.At(0, 0).AsInteger()));
  }

  StatsObserver::Snapshot s = stats.Get(OperationKind::kExecute);
  std::printf("\nexecute attempts=%llu failures=%llu max=%lluus\n",
              static_cast<unsigned long long>(s.attempts),
              static_cast<unsigned long long>(s.failures),
              static_cast<unsigned long long>(s.max_ns / 1000));

  db.Close();
  std::printf("Done.\n");
  return 0;
}
