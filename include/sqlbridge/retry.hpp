// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge retry -- capped exponential backoff with jitter.
//
// Design:
//   - Only errors whose class is kRetryable are re-attempted (see
//     ClassifyCode() in error.hpp); terminal errors return at once
//   - Delay after failed attempt n (1-based): min(max, base * 2^(n-1)),
//     drawn from [delay/2, delay] when jitter is on
//   - The surfaced Error carries the number of attempts made
//   - Used for non-transactional operations only; transactions never
//     re-issue single statements

#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <thread>
#include <utility>

#include "sqlbridge/config.hpp"
#include "sqlbridge/error.hpp"
#include "sqlbridge/log.hpp"

namespace sqlbridge {

inline std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy,
                                              uint32_t attempt) {
  if (attempt == 0) { attempt = 1; }
  int64_t base = policy.base_backoff.count();
  int64_t cap = policy.max_backoff.count();
  int64_t delay = base;
  for (uint32_t i = 1; i < attempt && delay < cap; ++i) { delay *= 2; }
  if (delay > cap) { delay = cap; }
  return std::chrono::milliseconds(delay);
}

inline std::chrono::milliseconds JitteredDelay(const RetryPolicy& policy,
                                               uint32_t attempt) {
  std::chrono::milliseconds delay = BackoffDelay(policy, attempt);
  if (!policy.jitter || delay.count() < 2) { return delay; }
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int64_t> dist(delay.count() / 2,
                                              delay.count());
  return std::chrono::milliseconds(dist(rng));
}

/// Run `attempt_fn(attempt)` until it succeeds, fails terminally, or the
/// policy's attempts are used up. `attempt_fn` returns Error.
template <typename Fn>
Error RunWithRetry(const RetryPolicy& policy, const char* what,
                   Fn&& attempt_fn) {
  uint32_t max_attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  Error err;
  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    err = attempt_fn(attempt);
    err.attempts = static_cast<int32_t>(attempt);
    if (err.ok() || !err.Retryable() || attempt == max_attempts) {
      break;
    }
    std::chrono::milliseconds delay = JitteredDelay(policy, attempt);
    Log().warn("{} failed with {} (attempt {}/{}), retrying in {}ms: {}",
               what, ErrorCodeName(err.code), attempt, max_attempts,
               delay.count(), err.message);
    std::this_thread::sleep_for(delay);
  }
  return err;
}

}  // namespace sqlbridge
