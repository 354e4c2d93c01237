// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace equirelay {
namespace util {

/**
 * Mockable wall clock
 *
 * Session deadlines, registration timestamps and the future-time rule all
 * read the clock through GetTime(), so tests can drive expiry without
 * sleeping. A mock time of 0 means "use the real clock".
 */

/**
 * Current Unix time in seconds (mock time if set)
 */
int64_t GetTime();

/**
 * Set mock time (0 disables mocking)
 */
void SetMockTime(int64_t time);

/**
 * Current mock time setting, 0 if disabled
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper: sets mock time and restores the previous value on exit
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace equirelay
