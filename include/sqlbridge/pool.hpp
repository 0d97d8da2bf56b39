// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Pool -- bounded session pool with health-checked reuse.
//
// Design:
//   - Owns every Session it opens; callers get a move-only PoolLease that
//     hands the session back on destruction
//   - At most max_connections sessions exist (idle + leased); Acquire()
//     waits on a condition variable until one is free or the acquisition
//     timeout passes (kPoolTimeout)
//   - Every return notifies one waiter, so a freed session is picked up
//     at once
//   - Idle sessions unused for longer than health_check_interval are
//     pinged before reuse; a failed ping discards them
//   - A lease marked broken (connection-level failure, cancellation) is
//     discarded on return; a replacement is opened lazily on demand
//   - Embedded pools are clamped to one session: the pool then acts as the
//     mutual-exclusion lock around the single engine handle
//   - Sessions are opened, pinged and closed outside the pool mutex
//   - All leases must be returned before the pool is destroyed

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/log.hpp"
#include "sqlbridge/session.hpp"

namespace sqlbridge {

class Pool;

// ---------------------------------------------------------------------------
// PoolLease
// ---------------------------------------------------------------------------

class PoolLease {
 public:
  PoolLease() = default;

  ~PoolLease() { Release(); }

  // Move
  PoolLease(PoolLease&& other) noexcept
      : pool_(other.pool_),
        session_(std::move(other.session_)),
        broken_(other.broken_) {
    other.pool_ = nullptr;
    other.broken_ = false;
  }

  PoolLease& operator=(PoolLease&& other) noexcept {
    if (this != &other) {
      Release();
      pool_ = other.pool_;
      session_ = std::move(other.session_);
      broken_ = other.broken_;
      other.pool_ = nullptr;
      other.broken_ = false;
    }
    return *this;
  }

  // No copy
  PoolLease(const PoolLease&) = delete;
  PoolLease& operator=(const PoolLease&) = delete;

  Session* get() const { return session_.get(); }
  Session* operator->() const { return session_.get(); }
  explicit operator bool() const { return session_ != nullptr; }

  /// The session will be discarded instead of reused.
  void MarkBroken() { broken_ = true; }
  bool Broken() const { return broken_; }

  /// Hand the session back now (no-op on an empty lease).
  inline void Release();

 private:
  friend class Pool;

  PoolLease(Pool* pool, std::unique_ptr<Session> session)
      : pool_(pool), session_(std::move(session)) {}

  Pool* pool_ = nullptr;
  std::unique_ptr<Session> session_;
  bool broken_ = false;
};

// ---------------------------------------------------------------------------
// Pool
// ---------------------------------------------------------------------------

class Pool {
 public:
  /// Opens one new session; nullptr + out_error on failure.
  using Opener = std::function<std::unique_ptr<Session>(Error* out_error)>;

  struct Stats {
    uint32_t idle = 0;
    uint32_t in_use = 0;
    uint64_t created = 0;
    uint64_t discarded = 0;
  };

  Pool(BackendKind kind, PoolConfig config, Opener opener, std::string name)
      : kind_(kind),
        config_(config),
        opener_(std::move(opener)),
        name_(std::move(name)) {
    if (kind_ == BackendKind::kEmbedded && config_.max_connections != 1) {
      Log().info("pool '{}': embedded backend, max_connections {} -> 1",
                 name_, config_.max_connections);
      config_.max_connections = 1;
    }
    Log().info("pool '{}' ready ({} backend, max {} connections)", name_,
               BackendKindName(kind_), config_.max_connections);
  }

  ~Pool() { Drain(); }

  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  /// Lease a session, waiting up to acquisition_timeout. On failure the
  /// returned lease is empty and out_error says why.
  PoolLease Acquire(Error* out_error = nullptr) {
    auto deadline = std::chrono::steady_clock::now() +
                    config_.acquisition_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
      bool ready = cv_.wait_until(lock, deadline, [this] {
        return closed_ || !idle_.empty() || total_ < config_.max_connections;
      });
      if (!ready) {
        if (out_error != nullptr) {
          out_error->SetFormat(
              ErrorCode::kPoolTimeout,
              "pool '%s': no connection within %lld ms (%u in use)",
              name_.c_str(),
              static_cast<long long>(config_.acquisition_timeout.count()),
              total_);
        }
        return PoolLease{};
      }
      if (closed_) {
        if (out_error != nullptr) {
          out_error->SetFormat(ErrorCode::kShutdown, "pool '%s' is closed",
                               name_.c_str());
        }
        return PoolLease{};
      }

      if (!idle_.empty()) {
        Idle idle = std::move(idle_.back());
        idle_.pop_back();
        lock.unlock();

        auto now = std::chrono::steady_clock::now();
        if (now - idle.last_used >= config_.health_check_interval) {
          Error ping = idle.session->Ping();
          if (!ping.ok()) {
            Log().warn("pool '{}': idle connection failed health check "
                       "({}), discarding: {}",
                       name_, ErrorCodeName(ping.code), ping.message);
            idle.session.reset();
            lock.lock();
            --total_;
            ++discarded_;
            continue;
          }
        }
        return PoolLease(this, std::move(idle.session));
      }

      // total_ < max: reserve a slot, then open outside the lock.
      ++total_;
      lock.unlock();
      Error err;
      std::unique_ptr<Session> session = opener_(&err);
      if (session == nullptr) {
        if (err.ok()) { err.Set(ErrorCode::kError, "session open failed"); }
        Log().warn("pool '{}': opening connection failed ({}): {}", name_,
                   ErrorCodeName(err.code), err.message);
        {
          std::lock_guard<std::mutex> guard(mutex_);
          --total_;
        }
        cv_.notify_one();
        Report(out_error, err);
        return PoolLease{};
      }
      {
        std::lock_guard<std::mutex> guard(mutex_);
        ++created_;
      }
      return PoolLease(this, std::move(session));
    }
  }

  Stats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.idle = static_cast<uint32_t>(idle_.size());
    s.in_use = total_ - s.idle;
    s.created = created_;
    s.discarded = discarded_;
    return s;
  }

  /// Close idle sessions and refuse further acquisitions.
  void Drain() {
    std::vector<Idle> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ && idle_.empty()) { return; }
      closed_ = true;
      dropped.swap(idle_);
      total_ -= static_cast<uint32_t>(dropped.size());
    }
    cv_.notify_all();
    if (!dropped.empty()) {
      Log().info("pool '{}' drained ({} idle connection(s) closed)", name_,
                 dropped.size());
    }
  }

  BackendKind Kind() const { return kind_; }
  const PoolConfig& Config() const { return config_; }
  const std::string& Name() const { return name_; }

 private:
  friend class PoolLease;

  struct Idle {
    std::unique_ptr<Session> session;
    std::chrono::steady_clock::time_point last_used;
  };

  void Return(std::unique_ptr<Session> session, bool broken) {
    std::unique_ptr<Session> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (broken || closed_) {
        --total_;
        if (broken) { ++discarded_; }
        doomed = std::move(session);
      } else {
        idle_.push_back(
            Idle{std::move(session), std::chrono::steady_clock::now()});
      }
    }
    cv_.notify_one();
    if (broken) {
      Log().warn("pool '{}': discarded a broken connection", name_);
    }
    // doomed closes here, outside the mutex
  }

  BackendKind kind_;
  PoolConfig config_;
  Opener opener_;
  std::string name_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Idle> idle_;
  uint32_t total_ = 0;  // idle + leased
  uint64_t created_ = 0;
  uint64_t discarded_ = 0;
  bool closed_ = false;
};

inline void PoolLease::Release() {
  if (pool_ != nullptr && session_ != nullptr) {
    pool_->Return(std::move(session_), broken_);
  }
  pool_ = nullptr;
  session_.reset();
  broken_ = false;
}

}  // namespace sqlbridge
