// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace draftops {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Steady clock emulation under mock time. The first GetSteadyTime() call after
// SetMockTime() pins a real steady reference; later mock values are offsets
// from it, so the emulated clock keeps moving forward with the mock value.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock * 1000;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_initialized) {
    g_real_steady_reference = std::chrono::steady_clock::now();
    g_mock_steady_reference = mock;
    g_steady_initialized = true;
  }
  return g_real_steady_reference + std::chrono::seconds(mock - g_mock_steady_reference);
}

void SetMockTime(int64_t time) {
  int64_t previous = g_mock_time.exchange(time, std::memory_order_relaxed);

  // Re-anchor only when mocking starts. Advancing an active mock keeps the
  // existing reference so steady time moves by the delta.
  if (time != 0 && previous == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace draftops
