// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hive {
namespace util {

/**
 * RateLimiter - per-key token bucket used by the *_RL logging macros
 *
 * A key starts with a full bucket of `tokens_per_period` tokens; tokens refill
 * continuously at tokens_per_period / period_seconds and never exceed the
 * bucket size. Time comes from GetSteadyTime() so tests can drive it with
 * mock time.
 */
class RateLimiter {
public:
  // True if a message for `key` may be emitted now (consumes one token).
  bool should_log(const std::string& key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point refilled_at{};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace hive
