// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace draftops {
namespace util {

/**
 * Mockable time system for testing
 *
 * Production code calls GetTime()/GetTimeMillis()/GetSteadyTime() instead of
 * reading the system clocks directly. Tests call SetMockTime() to control the
 * current time; heartbeat staleness and pick timestamps then follow the mock
 * value. A mock time of 0 (default) means real time.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Get current time as Unix timestamp in milliseconds
 * Under mock time this is the mock value * 1000
 */
int64_t GetTimeMillis();

/**
 * Get current time as steady clock time point
 * Returns mock time if set, otherwise returns real steady clock time
 *
 * Note: When mock time is active, steady clock is simulated using the mock
 * value
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 *
 * Time does not advance automatically - tests must call SetMockTime() again
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as a human-readable UTC string
 *
 * Example: FormatTime(1729868000) -> "2024-10-25 14:53:20 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace draftops
