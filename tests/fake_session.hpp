// Copyright (c) 2024 liudegui. MIT License.
// Scripted Session and recording observer shared by the pool, database and
// transaction tests.

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/observer.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/session.hpp"

namespace sqlbridge {
namespace testing {

inline Error Fail(ErrorCode code, bool connection_fatal = false) {
  Error err = Error::Make(code, ErrorCodeName(code));
  err.connection_fatal = connection_fatal;
  return err;
}

/// Shared by every FakeSession a factory opens, so the test can script
/// failures and inspect calls after the pool owns the sessions.
struct FakeScript {
  std::mutex mu;
  std::deque<Error> open_failures;
  std::deque<Error> execute_failures;
  std::deque<Error> query_failures;
  std::deque<Error> commit_failures;
  bool ping_ok = true;
  QueryResult result;
  ExecResult exec_result{1, 0};
  std::vector<std::string> query_targets;  // target dsn of each Query()

  std::atomic<int> opens{0};
  std::atomic<int> closes{0};
  std::atomic<int> executes{0};
  std::atomic<int> queries{0};
  std::atomic<int> begins{0};
  std::atomic<int> commits{0};
  std::atomic<int> rollbacks{0};
  std::atomic<int> pings{0};

  static Error Pop(std::deque<Error>* q) {
    if (q->empty()) { return Error::Ok(); }
    Error err = q->front();
    q->pop_front();
    return err;
  }
};

class FakeSession : public Session {
 public:
  FakeSession(std::shared_ptr<FakeScript> script, BackendTarget target)
      : script_(std::move(script)), target_(std::move(target)) {
    script_->opens++;
  }

  ~FakeSession() override { script_->closes++; }

  BackendKind Kind() const override { return target_.kind; }

  Error Execute(const char* /*sql*/, const Params& /*params*/,
                ExecResult* out) override {
    script_->executes++;
    std::lock_guard<std::mutex> lock(script_->mu);
    Error err = FakeScript::Pop(&script_->execute_failures);
    if (err.ok() && out != nullptr) { *out = script_->exec_result; }
    return err;
  }

  Error Query(const char* /*sql*/, const Params& /*params*/,
              QueryResult* out) override {
    script_->queries++;
    std::lock_guard<std::mutex> lock(script_->mu);
    script_->query_targets.push_back(target_.dsn);
    Error err = FakeScript::Pop(&script_->query_failures);
    if (err.ok() && out != nullptr) { *out = script_->result; }
    return err;
  }

  Error Begin() override {
    script_->begins++;
    return Error::Ok();
  }

  Error Commit() override {
    script_->commits++;
    std::lock_guard<std::mutex> lock(script_->mu);
    return FakeScript::Pop(&script_->commit_failures);
  }

  Error Rollback() override {
    script_->rollbacks++;
    return Error::Ok();
  }

  Error Ping() override {
    script_->pings++;
    std::lock_guard<std::mutex> lock(script_->mu);
    return script_->ping_ok ? Error::Ok()
                            : Fail(ErrorCode::kConnectionLost, true);
  }

 private:
  std::shared_ptr<FakeScript> script_;
  BackendTarget target_;
};

inline SessionFactory FakeFactory(std::shared_ptr<FakeScript> script) {
  return [script](const BackendTarget& target,
                  Error* out_error) -> std::unique_ptr<Session> {
    Error err;
    {
      std::lock_guard<std::mutex> lock(script->mu);
      err = FakeScript::Pop(&script->open_failures);
    }
    if (!err.ok()) {
      Report(out_error, err);
      return nullptr;
    }
    return std::unique_ptr<Session>(new FakeSession(script, target));
  };
}

/// Keeps every reported attempt.
class RecordingObserver : public QueryObserver {
 public:
  void OnAttempt(const QueryEvent& ev) override {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(ev);
  }

  std::vector<QueryEvent> Events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

  size_t Count(OperationKind op) const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const QueryEvent& ev : events_) {
      if (ev.op == op) { ++n; }
    }
    return n;
  }

 private:
  mutable std::mutex mu_;
  std::vector<QueryEvent> events_;
};

/// Fast retries for tests.
inline RetryPolicy QuickRetry(uint32_t attempts) {
  RetryPolicy p;
  p.max_attempts = attempts;
  p.base_backoff = std::chrono::milliseconds(1);
  p.max_backoff = std::chrono::milliseconds(4);
  return p;
}

}  // namespace testing
}  // namespace sqlbridge
