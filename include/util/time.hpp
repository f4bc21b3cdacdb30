// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace blockledger {
namespace util {

/**
 * Mockable wall clock
 *
 * Production code calls GetTime() instead of reading the system clock
 * directly. Tests call SetMockTime() to pin the value so that block
 * timestamps, and therefore block hashes, are reproducible.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

// Returns 0 if mock time is disabled
int64_t GetMockTime();

/**
 * Format a Unix timestamp in the classic ctime() layout, local time, without
 * the trailing newline: "Sun Oct 18 18:43:00 2026"
 *
 * Block records carry this form in their "timestamp" field.
 */
std::string FormatCTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;
  MockTimeScope(MockTimeScope &&) = delete;
  MockTimeScope &operator=(MockTimeScope &&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace blockledger
