// STAKEGUARD - Logging System
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Process-wide logger shared by the polling, decision and presentation
// loops. Messages pass through secret redaction before any sink sees them.

#ifndef STAKEGUARD_UTIL_LOGGING_H
#define STAKEGUARD_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace stakeguard {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* POLL = "poll";
    constexpr const char* STAKE = "stake";
    constexpr const char* WALLET = "wallet";
    constexpr const char* EXEC = "exec";
    constexpr const char* MARKET = "market";
    constexpr const char* NOTIFY = "notify";
    constexpr const char* DISPLAY = "display";
}

/// Replacement text for redacted secrets
constexpr const char* REDACTED_TEXT = "#######";

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;            // Already redacted
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_{LogLevel::Trace};
};

/**
 * Terminal output: "HH:MM:SS LEVEL [category] message". Warnings and errors
 * go to stderr when `useStderr` is set, coloured by severity when the
 * stream is a terminal.
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        LogLevel level{LogLevel::Info};
        bool useColors{true};
        bool useStderr{false};
    };

    ConsoleSink() : ConsoleSink(Config()) {}
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * Action log file: "YYYY-MM-DD HH:MM:SS - LEVEL - message", one line per
 * entry. When the file passes `maxBytes` it is renamed to `<path>.1`
 * (shifting older copies up to `keepFiles`) and a fresh file is started.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        LogLevel level{LogLevel::Debug};
        size_t maxBytes{10 * 1024 * 1024};
        size_t keepFiles{5};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    void RotateLocked();

    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t written_{0};
};

/// Hands each entry to a callback (tests, embedding)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Flush and detach every sink
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the listed categories
    void EnableCategory(const std::string& category);
    /// Drop any category restriction
    void EnableAllCategories();

    /**
     * Register a secret that must never reach a sink or leave the process
     * in a notification. Empty strings are ignored.
     */
    void AddRedaction(const std::string& secret);
    void ClearRedactions();

    /// `text` with every registered secret replaced by REDACTED_TEXT
    std::string Redact(const std::string& text) const;

    void Log(LogLevel level, const std::string& category, const std::string& message);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};

    std::unordered_set<std::string> categories_;   // Empty: all enabled
    mutable std::mutex categoriesMutex_;

    std::vector<std::string> secrets_;
    mutable std::mutex secretsMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and submits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category) : level_(level), category_(category) {}
    ~LogStream() { Logger::Instance().Log(level_, category_, stream_.str()); }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STAKEGUARD_LOG(level, category) \
    if (::stakeguard::util::Logger::Instance().WillLog( \
            ::stakeguard::util::LogLevel::level, category)) \
        ::stakeguard::util::LogStream(::stakeguard::util::LogLevel::level, category)

#define LOG_TRACE(category)   STAKEGUARD_LOG(Trace, category)
#define LOG_DEBUG(category)   STAKEGUARD_LOG(Debug, category)
#define LOG_INFO(category)    STAKEGUARD_LOG(Info, category)
#define LOG_WARN(category)    STAKEGUARD_LOG(Warn, category)
#define LOG_ERROR(category)   STAKEGUARD_LOG(Error, category)
#define LOG_FATAL(category)   STAKEGUARD_LOG(Fatal, category)

} // namespace util
} // namespace stakeguard

#endif // STAKEGUARD_UTIL_LOGGING_H
