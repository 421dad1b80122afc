// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace blockdag {
namespace util {

/**
 * Mockable wall clock
 *
 * Block timestamps are Unix milliseconds, so the clock is too. Production
 * code calls GetTimeMillis(); tests and the simulator pin it with
 * SetMockTimeMillis() or MockTimeScope.
 */

/**
 * Current Unix time in milliseconds (mock value when set)
 */
int64_t GetTimeMillis();

/**
 * Current Unix time in seconds (mock value / 1000 when set)
 */
int64_t GetTime();

/**
 * Monotonic clock for measuring durations (never mocked)
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time in Unix milliseconds (0 disables mocking)
 */
void SetMockTimeMillis(int64_t time_ms);

/**
 * Current mock time setting (0 = real time)
 */
int64_t GetMockTimeMillis();

/**
 * Format Unix milliseconds as "2025-10-25 14:33:09.123 UTC"
 */
std::string FormatTimeMillis(int64_t unix_time_ms);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time_ms) : previous_time_ms_(GetMockTimeMillis()) {
    SetMockTimeMillis(time_ms);
  }

  ~MockTimeScope() { SetMockTimeMillis(previous_time_ms_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_ms_;
};

} // namespace util
} // namespace blockdag
