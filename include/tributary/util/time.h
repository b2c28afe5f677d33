// TRIBUTARY - Time Utilities
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Provides the ledger clock:
// - Unix timestamps (seconds), the only time source the core reads
// - Mock time for tests and the scenario simulator
// - Epoch-clock arithmetic
// - Formatting for log output

#ifndef TRIBUTARY_UTIL_TIME_H
#define TRIBUTARY_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace tributary {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;
constexpr int64_t MILLIS_PER_SECOND = 1000;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

/// Current time as a system time point (mock time when enabled)
SystemTimePoint GetSystemTime();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Epoch Clock
// ============================================================================

/**
 * Start of the epoch-clock period containing ts.
 *
 * Periods are aligned to the Unix epoch: [k * period, (k + 1) * period).
 * @param period Period length in seconds (must be positive)
 */
int64_t EpochStart(int64_t ts, int64_t period);

/// Start of the next epoch-clock period after ts
int64_t NextEpochStart(int64_t ts, int64_t period);

// ============================================================================
// Formatting
// ============================================================================

/// Format timestamp as ISO 8601 (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format duration as human-readable string (e.g., "1d 2h 3m 4s")
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time. The mock clock starts at the current wall time if it
/// has never been set.
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

/// Set mock time (takes effect while mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

/// Get mock time (0 if never set)
int64_t GetMockTime();

} // namespace util
} // namespace tributary

#endif // TRIBUTARY_UTIL_TIME_H
