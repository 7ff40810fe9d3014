// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace hive {
namespace util {

bool RateLimiter::should_log(const std::string& key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return true;
  }

  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(key);
  Bucket& bucket = it->second;
  if (inserted) {
    bucket.tokens = capacity;
    bucket.refilled_at = now;
  }

  // Whole seconds only, so a burst inside one second cannot refill itself.
  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.refilled_at).count();
  if (elapsed > 0) {
    bucket.tokens = std::min(capacity, bucket.tokens + capacity * static_cast<double>(elapsed) / period_seconds);
    bucket.refilled_at = now;
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace hive
