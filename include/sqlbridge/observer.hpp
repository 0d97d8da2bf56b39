// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::QueryObserver -- per-attempt instrumentation hook.
//
// Design:
//   - The Database reports every attempt (retries included, one call each)
//     synchronously, right after the attempt finishes
//   - Implementations must return quickly; they run on the calling thread
//   - Injected through DatabaseConfig::observer, never a global
//   - LoggingObserver and StatsObserver are ready-made sinks

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/log.hpp"

namespace sqlbridge {

enum class OperationKind : uint8_t {
  kExecute = 0,
  kQuery,
  kBegin,
  kCommit,
  kRollback,
};

constexpr size_t kNumOperationKinds = 5;

inline const char* OperationKindName(OperationKind op) {
  switch (op) {
    case OperationKind::kExecute: return "execute";
    case OperationKind::kQuery: return "query";
    case OperationKind::kBegin: return "begin";
    case OperationKind::kCommit: return "commit";
    case OperationKind::kRollback: return "rollback";
  }
  return "unknown";
}

struct QueryEvent {
  OperationKind op = OperationKind::kQuery;
  BackendKind backend = BackendKind::kEmbedded;
  std::chrono::nanoseconds duration{0};
  bool success = true;
  ErrorCode code = ErrorCode::kOk;
  uint32_t attempt = 1;  // 1-based within the logical operation
};

// ---------------------------------------------------------------------------
// QueryObserver
// ---------------------------------------------------------------------------

class QueryObserver {
 public:
  virtual ~QueryObserver() = default;
  virtual void OnAttempt(const QueryEvent& event) = 0;
};

/// Measures one attempt and reports it when Finish() is called.
class AttemptTimer {
 public:
  AttemptTimer(QueryObserver* observer, OperationKind op, BackendKind backend,
               uint32_t attempt)
      : observer_(observer),
        op_(op),
        backend_(backend),
        attempt_(attempt),
        start_(std::chrono::steady_clock::now()) {}

  void Finish(const Error& err) {
    if (observer_ == nullptr) { return; }
    QueryEvent ev;
    ev.op = op_;
    ev.backend = backend_;
    ev.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
    ev.success = err.ok();
    ev.code = err.code;
    ev.attempt = attempt_;
    observer_->OnAttempt(ev);
  }

 private:
  QueryObserver* observer_;
  OperationKind op_;
  BackendKind backend_;
  uint32_t attempt_;
  std::chrono::steady_clock::time_point start_;
};

// ---------------------------------------------------------------------------
// LoggingObserver
// ---------------------------------------------------------------------------

/// Logs successes at debug, failures at warn.
class LoggingObserver : public QueryObserver {
 public:
  void OnAttempt(const QueryEvent& ev) override {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  ev.duration).count();
    if (ev.success) {
      Log().debug("{} on {} backend, attempt {}: ok in {}us",
                  OperationKindName(ev.op), BackendKindName(ev.backend),
                  ev.attempt, us);
    } else {
      Log().warn("{} on {} backend, attempt {}: {} after {}us",
                 OperationKindName(ev.op), BackendKindName(ev.backend),
                 ev.attempt, ErrorCodeName(ev.code), us);
    }
  }
};

// ---------------------------------------------------------------------------
// StatsObserver
// ---------------------------------------------------------------------------

/// Lock-free counters per operation kind.
class StatsObserver : public QueryObserver {
 public:
  struct Snapshot {
    uint64_t attempts = 0;
    uint64_t failures = 0;
    uint64_t total_ns = 0;
    uint64_t max_ns = 0;
  };

  void OnAttempt(const QueryEvent& ev) override {
    Counters& c = counters_[static_cast<size_t>(ev.op)];
    uint64_t ns = static_cast<uint64_t>(ev.duration.count());
    c.attempts.fetch_add(1, std::memory_order_relaxed);
    if (!ev.success) { c.failures.fetch_add(1, std::memory_order_relaxed); }
    c.total_ns.fetch_add(ns, std::memory_order_relaxed);
    uint64_t prev = c.max_ns.load(std::memory_order_relaxed);
    while (ns > prev &&
           !c.max_ns.compare_exchange_weak(prev, ns,
                                           std::memory_order_relaxed)) {
    }
  }

  Snapshot Get(OperationKind op) const {
    const Counters& c = counters_[static_cast<size_t>(op)];
    Snapshot s;
    s.attempts = c.attempts.load(std::memory_order_relaxed);
    s.failures = c.failures.load(std::memory_order_relaxed);
    s.total_ns = c.total_ns.load(std::memory_order_relaxed);
    s.max_ns = c.max_ns.load(std::memory_order_relaxed);
    return s;
  }

 private:
  struct Counters {
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> total_ns{0};
    std::atomic<uint64_t> max_ns{0};
  };

  std::array<Counters, kNumOperationKinds> counters_;
};

}  // namespace sqlbridge
