// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Executor -- fixed-size worker thread pool.
//
// Design:
//   - FIFO task queue guarded by a mutex + condition variable
//   - Post() returns false once Shutdown() has begun; the caller decides
//     how to complete its promise in that case
//   - Shutdown() lets queued tasks finish, then joins the workers
//   - The Database owns one executor per execution model: a shared pool
//     for networked sessions and a single dedicated thread for the
//     blocking embedded engine

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "sqlbridge/log.hpp"

namespace sqlbridge {

class Executor {
 public:
  Executor(uint32_t num_threads, std::string name)
      : name_(std::move(name)) {
    if (num_threads == 0) { num_threads = 1; }
    workers_.reserve(num_threads);
    for (uint32_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([this] { WorkerLoop(); });
    }
    Log().debug("executor '{}' started with {} thread(s)", name_,
                num_threads);
  }

  ~Executor() { Shutdown(); }

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  /// Queue `task`. Returns false if the executor is shutting down.
  bool Post(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) { return false; }
      queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) { return; }
      stopping_ = true;
    }
    cv_.notify_all();
    for (std::thread& t : workers_) {
      if (t.joinable()) { t.join(); }
    }
    Log().debug("executor '{}' stopped", name_);
  }

  size_t NumThreads() const { return workers_.size(); }

 private:
  void WorkerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) { return; }  // stopping and drained
        task = std::move(queue_.front());
        queue_.pop_front();
      }
      task();
    }
  }

  std::string name_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  std::vector<std::thread> workers_;
  bool stopping_ = false;
};

}  // namespace sqlbridge
