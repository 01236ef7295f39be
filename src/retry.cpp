#include "retry.hpp"
#include <algorithm>
#include <cmath>

RetryScheduler::RetryScheduler(const RetryPolicy& policy) : RetryScheduler(policy, std::random_device{}()) {}

RetryScheduler::RetryScheduler(const RetryPolicy& policy, uint32_t seed) : policy(policy), rng(seed) {}

std::chrono::milliseconds RetryScheduler::delay_for(unsigned attempt, double unit) const {
  double max_ms = static_cast<double>(policy.max_delay.count());
  double base = static_cast<double>(policy.initial_delay.count()) * std::pow(policy.multiplier, static_cast<double>(attempt));
  base = std::min(base, max_ms);

  unit = std::clamp(unit, 0.0, 1.0);
  double factor = 1.0 + policy.jitter * (2.0 * unit - 1.0);
  double ms = std::clamp(base * factor, 0.0, max_ms);
  return std::chrono::milliseconds(static_cast<long long>(std::llround(ms)));
}

std::chrono::milliseconds RetryScheduler::next_delay(unsigned attempt) {
  double unit;
  {
    std::lock_guard<std::mutex> lock(rng_mutex);
    unit = std::uniform_real_distribution<double>(0.0, 1.0)(rng);
  }
  return delay_for(attempt, unit);
}
