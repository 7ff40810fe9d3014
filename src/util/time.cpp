// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace hive {
namespace util {

namespace {

std::atomic<int64_t> g_mock_time{0};

// Anchor pairing a real steady time point with the mock value current when
// mock time was first read through GetSteadyTime().
std::mutex g_anchor_mutex;
bool g_anchor_set{false};
std::chrono::steady_clock::time_point g_anchor_steady;
int64_t g_anchor_mock{0};

}  // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_anchor_mutex);
  if (!g_anchor_set) {
    g_anchor_steady = std::chrono::steady_clock::now();
    g_anchor_mock = mock;
    g_anchor_set = true;
  }
  return g_anchor_steady + std::chrono::seconds(mock - g_anchor_mock);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_anchor_mutex);
    g_anchor_set = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace hive
