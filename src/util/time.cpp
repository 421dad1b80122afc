// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace blockdag {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time_ms{0};

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t GetTime() { return GetTimeMillis() / 1000; }

std::chrono::steady_clock::time_point GetSteadyTime() {
  return std::chrono::steady_clock::now();
}

void SetMockTimeMillis(int64_t time_ms) {
  g_mock_time_ms.store(time_ms, std::memory_order_relaxed);
}

int64_t GetMockTimeMillis() { return g_mock_time_ms.load(std::memory_order_relaxed); }

std::string FormatTimeMillis(int64_t unix_time_ms) {
  std::time_t t = static_cast<std::time_t>(unix_time_ms / 1000);
  int64_t millis = unix_time_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --t;
  }

  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << millis << " UTC";
  return oss.str();
}

} // namespace util
} // namespace blockdag
