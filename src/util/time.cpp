// STAKEGUARD - Time Utilities Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/util/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stakeguard {
namespace util {

// ============================================================================
// Formatting
// ============================================================================

std::string FormatTime(SystemTimePoint tp, const char* format) {
    auto time = SystemClock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, format);
    return oss.str();
}

std::string FormatClockAfter(int64_t seconds) {
    return FormatTime(SystemClock::now() + Seconds{seconds}, "%H:%M");
}

std::string FormatHMS(int64_t seconds) {
    if (seconds < 0) {
        seconds = 0;
    }

    int64_t hours = seconds / SECONDS_PER_HOUR;
    int64_t remainder = seconds % SECONDS_PER_HOUR;
    int64_t minutes = remainder / SECONDS_PER_MINUTE;
    int64_t secs = remainder % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    oss << secs << "s";
    return oss.str();
}

// ============================================================================
// CancellationToken
// ============================================================================

void CancellationToken::RequestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    condition_.notify_all();
}

bool CancellationToken::WaitFor(Milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool cancelled = condition_.wait_for(lock, duration, [this] {
        return stopped_.load();
    });
    return !cancelled;
}

} // namespace util
} // namespace stakeguard
