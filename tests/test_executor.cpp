// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlbridge::Executor.

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <thread>

#include "sqlbridge/executor.hpp"

using namespace sqlbridge;

TEST_CASE("Executor: runs posted tasks", "[executor]") {
  Executor ex(4, "test");
  REQUIRE(ex.NumThreads() == 4);

  std::atomic<int> sum{0};
  for (int i = 1; i <= 100; ++i) {
    REQUIRE(ex.Post([&sum, i] { sum += i; }));
  }
  ex.Shutdown();
  REQUIRE(sum == 5050);
}

TEST_CASE("Executor: single thread preserves order", "[executor]") {
  Executor ex(1, "ordered");
  std::mutex mu;
  std::vector<int> seen;
  std::set<std::thread::id> threads;
  for (int i = 0; i < 20; ++i) {
    ex.Post([&, i] {
      std::lock_guard<std::mutex> lock(mu);
      seen.push_back(i);
      threads.insert(std::this_thread::get_id());
    });
  }
  ex.Shutdown();
  REQUIRE(seen.size() == 20);
  for (int i = 0; i < 20; ++i) { REQUIRE(seen[i] == i); }
  REQUIRE(threads.size() == 1);
  REQUIRE(threads.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("Executor: Post after Shutdown is refused", "[executor]") {
  Executor ex(2, "closed");
  ex.Shutdown();
  REQUIRE_FALSE(ex.Post([] {}));
  ex.Shutdown();  // idempotent
}

TEST_CASE("Executor: zero threads is clamped to one", "[executor]") {
  Executor ex(0, "clamped");
  REQUIRE(ex.NumThreads() == 1);
  std::promise<int> p;
  std::future<int> f = p.get_future();
  REQUIRE(ex.Post([&p] { p.set_value(7); }));
  REQUIRE(f.get() == 7);
}
