// STAKEGUARD - Logging System
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/util/logging.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>

namespace stakeguard {
namespace util {

namespace {

std::tm LocalTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string FormatTime(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::tm tm = LocalTime(tp);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;31m";
        default:              return "";
    }
}

constexpr const char* COLOR_RESET = "\033[0m";

} // namespace

// ============================================================================
// Log Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string name(str);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal" || name == "critical") return LogLevel::Fatal;
    if (name == "off" || name == "none") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {
    SetLevel(config.level);
}

void ConsoleSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::ostream& out = (config_.useStderr && entry.level >= LogLevel::Warn)
        ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(mutex_);
    out << FormatTime(entry.timestamp, "%H:%M:%S") << ' ';
    if (config_.useColors) {
        out << LevelColor(entry.level) << LogLevelToString(entry.level) << COLOR_RESET;
    } else {
        out << LogLevelToString(entry.level);
    }
    out << " [" << entry.category << "] " << entry.message << '\n';
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    SetLevel(config.level);
    file_.open(config_.path, std::ios::app);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        written_ = static_cast<size_t>(file_.tellp());
    }
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }

    std::string line = FormatTime(entry.timestamp, "%Y-%m-%d %H:%M:%S");
    line += " - ";
    line += LogLevelToString(entry.level);
    line += " - ";
    line += entry.message;
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxBytes > 0 && written_ > 0 && written_ + line.size() > config_.maxBytes) {
        RotateLocked();
    }
    file_ << line;
    written_ += line.size();
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::RotateLocked() {
    file_.close();

    if (config_.keepFiles > 0) {
        // path.N-1 -> path.N, ..., path -> path.1
        for (size_t i = config_.keepFiles; i > 1; --i) {
            std::string from = config_.path + "." + std::to_string(i - 1);
            std::string to = config_.path + "." + std::to_string(i);
            std::rename(from.c_str(), to.c_str());
        }
        std::string first = config_.path + ".1";
        std::rename(config_.path.c_str(), first.c_str());
    } else {
        std::remove(config_.path.c_str());
    }

    file_.open(config_.path, std::ios::trunc);
    written_ = 0;
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)) {
    SetLevel(level);
}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_ && Accepts(entry)) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
}

void Logger::AddRedaction(const std::string& secret) {
    if (secret.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(secretsMutex_);
    if (std::find(secrets_.begin(), secrets_.end(), secret) == secrets_.end()) {
        secrets_.push_back(secret);
    }
}

void Logger::ClearRedactions() {
    std::lock_guard<std::mutex> lock(secretsMutex_);
    secrets_.clear();
}

std::string Logger::Redact(const std::string& text) const {
    std::lock_guard<std::mutex> lock(secretsMutex_);
    if (secrets_.empty()) {
        return text;
    }

    std::string out(text);
    for (const auto& secret : secrets_) {
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), REDACTED_TEXT);
            pos += std::char_traits<char>::length(REDACTED_TEXT);
        }
    }
    return out;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    LogLevel threshold = level_.load();
    if (threshold == LogLevel::Off || level < threshold) {
        return false;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = Redact(message);
    entry.timestamp = std::chrono::system_clock::now();

    // Copy so a sink may log or detach itself without deadlocking
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Flush();
    }
}

} // namespace util
} // namespace stakeguard
