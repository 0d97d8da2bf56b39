// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge configuration -- backend targets, pool and retry settings.
//
// Design:
//   - Plain structs with defaults, fixed at construction of the objects
//     that take them (Pool, Database); nothing mutates them afterwards
//   - Validate() reports bad settings as an Error instead of asserting
//   - Networked DSN format: "host:port:user:password:database"
//       e.g. "localhost:3306:root:pass:testdb"
//       or   "127.0.0.1:3306:root::mydb" (empty password)
//   - Embedded target: a filesystem path, ":memory:" or a "file:" URI

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlbridge/error.hpp"

namespace sqlbridge {

class QueryObserver;
class Session;

// ---------------------------------------------------------------------------
// BackendKind / BackendTarget
// ---------------------------------------------------------------------------

enum class BackendKind : uint8_t {
  kNetworked = 0,  // MariaDB / MySQL
  kEmbedded,       // SQLite3
};

inline const char* BackendKindName(BackendKind kind) {
  return kind == BackendKind::kNetworked ? "networked" : "embedded";
}

struct BackendTarget {
  BackendKind kind = BackendKind::kEmbedded;
  std::string dsn;

  static BackendTarget Networked(std::string dsn) {
    return BackendTarget{BackendKind::kNetworked, std::move(dsn)};
  }

  static BackendTarget Embedded(std::string path) {
    return BackendTarget{BackendKind::kEmbedded, std::move(path)};
  }
};

// ---------------------------------------------------------------------------
// DSN
// ---------------------------------------------------------------------------

struct DsnConfig {
  std::string host = "localhost";
  uint16_t port = 3306;
  std::string user = "root";
  std::string password;
  std::string database;
};

/// Parse "host:port:user:password:database". Fields can be empty and
/// keep their defaults. Minimal: "localhost:3306:root::testdb".
inline Error ParseDsn(const char* dsn, DsnConfig* out) {
  if (dsn == nullptr || out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "dsn is null");
  }
  std::vector<std::string> parts;
  std::string cur;
  for (const char* p = dsn; *p != '\0'; ++p) {
    if (*p == ':' && parts.size() < 4) {
      parts.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(*p);
    }
  }
  parts.push_back(cur);

  DsnConfig cfg;
  if (parts.size() >= 1 && !parts[0].empty()) { cfg.host = parts[0]; }
  if (parts.size() >= 2 && !parts[1].empty()) {
    char* end = nullptr;
    unsigned long port = std::strtoul(parts[1].c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || port == 0 || port > 65535) {
      Error err;
      err.SetFormat(ErrorCode::kRange, "invalid port '%s' in dsn",
                    parts[1].c_str());
      return err;
    }
    cfg.port = static_cast<uint16_t>(port);
  }
  if (parts.size() >= 3 && !parts[2].empty()) { cfg.user = parts[2]; }
  if (parts.size() >= 4) { cfg.password = parts[3]; }
  if (parts.size() >= 5) { cfg.database = parts[4]; }
  *out = std::move(cfg);
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// PoolConfig
// ---------------------------------------------------------------------------

struct PoolConfig {
  uint32_t max_connections = 8;
  std::chrono::milliseconds acquisition_timeout{5000};
  // Idle sessions older than this are pinged before reuse; zero pings
  // on every checkout.
  std::chrono::milliseconds health_check_interval{30000};

  Error Validate() const {
    if (max_connections == 0) {
      return Error::Make(ErrorCode::kRange, "max_connections must be > 0");
    }
    if (acquisition_timeout.count() < 0) {
      return Error::Make(ErrorCode::kRange,
                         "acquisition_timeout must not be negative");
    }
    if (health_check_interval.count() < 0) {
      return Error::Make(ErrorCode::kRange,
                         "health_check_interval must not be negative");
    }
    return Error::Ok();
  }
};

// ---------------------------------------------------------------------------
// RetryPolicy
// ---------------------------------------------------------------------------

struct RetryPolicy {
  uint32_t max_attempts = 3;  // total attempts, including the first
  std::chrono::milliseconds base_backoff{10};
  std::chrono::milliseconds max_backoff{1000};
  bool jitter = true;

  static RetryPolicy NoRetry() {
    RetryPolicy p;
    p.max_attempts = 1;
    return p;
  }

  Error Validate() const {
    if (max_attempts == 0) {
      return Error::Make(ErrorCode::kRange, "max_attempts must be > 0");
    }
    if (base_backoff.count() < 0 || max_backoff < base_backoff) {
      return Error::Make(ErrorCode::kRange,
                         "backoff bounds must satisfy 0 <= base <= max");
    }
    return Error::Ok();
  }
};

// ---------------------------------------------------------------------------
// DatabaseConfig
// ---------------------------------------------------------------------------

/// Opens a session for `target`. Returns nullptr and fills out_error on
/// failure.
using SessionFactory = std::function<std::unique_ptr<Session>(
    const BackendTarget& target, Error* out_error)>;

struct DatabaseConfig {
  BackendTarget primary;
  std::vector<BackendTarget> replicas;
  PoolConfig pool;
  RetryPolicy retry;
  uint32_t worker_threads = 4;     // networked executor size
  int32_t busy_timeout_ms = 5000;  // lock wait applied to each new session
  // Not owned; must outlive the Database. nullptr disables reporting.
  QueryObserver* observer = nullptr;
  // Overrides the built-in backend sessions (tests, custom drivers).
  SessionFactory session_factory;

  Error Validate() const {
    if (primary.dsn.empty()) {
      return Error::Make(ErrorCode::kNullParam, "primary target is empty");
    }
    for (const BackendTarget& r : replicas) {
      if (r.kind != primary.kind) {
        return Error::Make(ErrorCode::kMisuse,
                           "replica backend kind differs from primary");
      }
      if (r.dsn.empty()) {
        return Error::Make(ErrorCode::kNullParam, "replica target is empty");
      }
    }
    if (worker_threads == 0) {
      return Error::Make(ErrorCode::kRange, "worker_threads must be > 0");
    }
    Error err = pool.Validate();
    if (!err.ok()) { return err; }
    return retry.Validate();
  }
};

}  // namespace sqlbridge
