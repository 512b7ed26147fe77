// STAKEGUARD - Time Utilities
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Provides time-related utilities:
// - Clock aliases
// - Time and countdown formatting
// - Cooperative cancellation for the long-running loops

#ifndef STAKEGUARD_UTIL_TIME_H
#define STAKEGUARD_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace stakeguard {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;

// ============================================================================
// Formatting
// ============================================================================

/// Format a time point in local time with a strftime format
std::string FormatTime(SystemTimePoint tp, const char* format);

/// Local wall-clock time `seconds` from now, as "HH:MM"
std::string FormatClockAfter(int64_t seconds);

/**
 * Countdown format "1h 20m 5s". Zero hour/minute parts are skipped but the
 * seconds part is always present ("0s", "2m 0s"). Negative input is "0s".
 */
std::string FormatHMS(int64_t seconds);

// ============================================================================
// Cancellation
// ============================================================================

/**
 * Process-wide stop signal shared by every loop. Waiting on the token is the
 * only suspension primitive the loops use, so a stop request wakes every
 * sleeper immediately.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Request cancellation and wake all waiters
    void RequestStop();

    bool StopRequested() const { return stopped_.load(); }

    /**
     * Sleep for `duration` unless cancelled first.
     * @return true if the full duration elapsed, false if cancelled
     */
    bool WaitFor(Milliseconds duration);

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace util
} // namespace stakeguard

#endif // STAKEGUARD_UTIL_TIME_H
