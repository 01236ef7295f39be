#pragma once
// Reconnect backoff policy.
//
// delay(attempt) = min(max_delay, initial_delay * multiplier^attempt),
// then scaled by a random factor in [1 - jitter, 1 + jitter] and clamped
// to max_delay again. `attempt` counts consecutive failures, starting at 0.
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

struct RetryPolicy {
  std::chrono::milliseconds initial_delay{500};
  std::chrono::milliseconds max_delay{8000};
  double multiplier = 2.0;
  double jitter = 0.2;
};

class RetryScheduler {
  RetryPolicy policy;
  std::mt19937 rng;
  std::mutex rng_mutex;

public:
  explicit RetryScheduler(const RetryPolicy& policy = RetryPolicy{});
  RetryScheduler(const RetryPolicy& policy, uint32_t seed);

  // Deterministic part: `unit` in [0, 1] picks the point inside the jitter band.
  std::chrono::milliseconds delay_for(unsigned attempt, double unit) const;

  // Delay before the next connect after `attempt` consecutive failures.
  std::chrono::milliseconds next_delay(unsigned attempt);

  const RetryPolicy& retry_policy() const {
    return policy;
  }
};
