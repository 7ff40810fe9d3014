// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace hive {
namespace util {

// Unix time in seconds, or the mock time when one is set.
int64_t GetTime();

// Monotonic clock. Under mock time it advances with the mock value so that
// rate limiting and timeouts can be tested without sleeping.
std::chrono::steady_clock::time_point GetSteadyTime();

// 0 disables mock time.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// RAII mock time for tests; restores the previous value on destruction.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace hive
