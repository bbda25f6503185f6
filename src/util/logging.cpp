// ANCHORZK - Logging Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>

#include <unistd.h>

namespace anchorzk {
namespace util {

// ============================================================================
// Levels
// ============================================================================

namespace {

struct LevelInfo {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelInfo LEVELS[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35;1m"},
    {LogLevel::Off,   "OFF",   "\033[0m"},
};

const LevelInfo& Describe(LogLevel level) {
    return LEVELS[static_cast<size_t>(level)];
}

constexpr const char* RESET_COLOR = "\033[0m";

} // anonymous namespace

const char* LogLevelToString(LogLevel level) {
    return Describe(level).name;
}

bool ParseLogLevel(const std::string& str, LogLevel& out) {
    std::string name(str.size(), '\0');
    std::transform(str.begin(), str.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "WARNING") {
        name = "WARN";
    }
    for (const LevelInfo& info : LEVELS) {
        if (name == info.name) {
            out = info.level;
            return true;
        }
    }
    return false;
}

const std::vector<std::string>& KnownLogCategories() {
    static const std::vector<std::string> categories = {
        LogCategory::DEFAULT, LogCategory::SETUP, LogCategory::TREE,
        LogCategory::PROVER, LogCategory::VERIFIER, LogCategory::CONFIG,
    };
    return categories;
}

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[20];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char out[32];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(millis));
    return out;
}

// ============================================================================
// Sinks
// ============================================================================

std::string ConsoleSink::Format(const LogEntry& entry) const {
    std::string line;
    if (options_.timestamps) {
        line += FormatLogTimestamp(entry.timestamp) + " ";
    }

    std::string level = LogLevelToString(entry.level);
    level.resize(5, ' ');
    line += "[" + level + "] ";

    if (options_.categories && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        line += "[" + entry.category + "] ";
    }
    if (options_.threadIds) {
        std::ostringstream id;
        id << entry.threadId;
        line += "[" + id.str() + "] ";
    }
    return line + entry.message;
}

void ConsoleSink::Write(const LogEntry& entry) {
    if (!Accepts(entry.level)) {
        return;
    }
    const bool toStderr = options_.errorsToStderr && entry.level >= LogLevel::Error;
    std::ostream& out = toStderr ? std::cerr : std::cout;
    const bool colored = options_.colors && isatty(toStderr ? STDERR_FILENO : STDOUT_FILENO);

    std::string line = Format(entry);
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (colored) {
        out << Describe(entry.level).color << line << RESET_COLOR << '\n';
    } else {
        out << line << '\n';
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::cout.flush();
    std::cerr.flush();
}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_ && Accepts(entry.level)) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>());
    }
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(sinks_.begin(), sinks_.end(), sink);
    if (it != sinks_.end()) {
        sinks_.erase(it);
    }
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

std::vector<std::shared_ptr<ILogSink>> Logger::SnapshotSinks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_;
}

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    categoryLevels_[category] = level;
}

void Logger::ResetCategoryLevels() {
    std::lock_guard<std::mutex> lock(mutex_);
    categoryLevels_.clear();
}

LogLevel Logger::EffectiveLevel(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = categoryLevels_.find(category);
    return it != categoryLevels_.end() ? it->second : level_.load();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off) {
        return false;
    }
    LogLevel threshold = EffectiveLevel(category);
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::Log(LogLevel level, const std::string& category, std::string message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = std::move(message);
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    for (const auto& sink : SnapshotSinks()) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    int length = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);

    std::string message;
    if (length > 0) {
        std::vector<char> buffer(static_cast<size_t>(length) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), format, args);
        message.assign(buffer.data(), static_cast<size_t>(length));
    }
    va_end(args);

    Log(level, category, std::move(message), file, line);
}

void Logger::Flush() {
    for (const auto& sink : SnapshotSinks()) {
        sink->Flush();
    }
}

// ============================================================================
// Helpers
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, buffer_.str(), file_, line_);
}

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation)
    : category_(category), operation_(std::move(operation)),
      start_(std::chrono::steady_clock::now()) {
    LOG_DEBUG(category_) << operation_ << " started";
}

ScopedLogTimer::~ScopedLogTimer() {
    LOG_DEBUG(category_) << operation_ << " finished in " << ElapsedMs() << "ms";
}

int64_t ScopedLogTimer::ElapsedMs() const {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

} // namespace util
} // namespace anchorzk
