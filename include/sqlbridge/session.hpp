// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Session -- capability interface over one live backend handle.
//
// Design:
//   - One implementation per backend (Sqlite3Session, MariaSession); tests
//     plug in their own
//   - Parameters and results are backend-neutral (Params / QueryResult);
//     no backend handle crosses this interface
//   - Every method reports through the returned Error; a failed Query()
//     leaves *out untouched
//   - Sessions are owned by a Pool and used by one caller at a time, so
//     implementations need no internal locking

#pragma once

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

class Session {
 public:
  virtual ~Session() = default;

  virtual BackendKind Kind() const = 0;

  /// Statement without a result set.
  virtual Error Execute(const char* sql, const Params& params,
                        ExecResult* out) = 0;

  /// Statement producing rows; all rows are materialised.
  virtual Error Query(const char* sql, const Params& params,
                      QueryResult* out) = 0;

  virtual Error Begin() = 0;
  virtual Error Commit() = 0;
  virtual Error Rollback() = 0;

  /// Cheap liveness probe used by the pool's health check.
  virtual Error Ping() = 0;
};

/// MariaDB treats backslash as an escape inside string literals.
inline bool UsesBackslashEscapes(BackendKind kind) {
  return kind == BackendKind::kNetworked;
}

}  // namespace sqlbridge
