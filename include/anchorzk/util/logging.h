// ANCHORZK - Logging System
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Leveled logging with per-category thresholds and pluggable sinks.
// Stream-style and printf-style front ends. Thread-safe; sinks are
// invoked outside the logger lock, so a sink may itself log.

#ifndef ANCHORZK_UTIL_LOGGING_H
#define ANCHORZK_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace anchorzk {
namespace util {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

/// Upper-case name ("INFO")
const char* LogLevelToString(LogLevel level);

/// Case-insensitive parse; "warning" is accepted for Warn. Returns false
/// and leaves `out` untouched for an unknown name.
bool ParseLogLevel(const std::string& str, LogLevel& out);

// ============================================================================
// Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* SETUP = "setup";
    constexpr const char* TREE = "tree";
    constexpr const char* PROVER = "prover";
    constexpr const char* VERIFIER = "verifier";
    constexpr const char* CONFIG = "config";
}

/// Every category the library logs under
const std::vector<std::string>& KnownLogCategories();

// ============================================================================
// Entries and Sinks
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Output destination. Write() may be called from any thread.
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    /// Entries below this level are ignored by the sink
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

private:
    std::atomic<LogLevel> level_{LogLevel::Trace};
};

/// Human-readable lines on stdout; Error and above optionally on stderr
class ConsoleSink : public ILogSink {
public:
    struct Options {
        bool colors{true};
        bool errorsToStderr{true};
        bool timestamps{true};
        bool categories{true};
        bool threadIds{false};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Options& options) : options_(options) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;

    /// "[time ][LEVEL] [category] message" without colour codes
    std::string Format(const LogEntry& entry) const;

private:
    Options options_;
    std::mutex writeMutex_;
};

/// Forwards entries to a callback; used to capture output in tests
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

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

    /// Attach a ConsoleSink when no sink is attached yet
    void Initialize();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Threshold for categories without an override
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Per-category threshold; LogLevel::Off silences the category
    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ResetCategoryLevels();

    /// Override for `category`, else the global threshold
    LogLevel EffectiveLevel(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, std::string message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> SnapshotSinks() const;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::map<std::string, LogLevel> categoryLevels_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

// ============================================================================
// Stream Front End
// ============================================================================

/// Buffers one message and hands it to the logger when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    std::ostringstream buffer_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

#define ANCHORZK_LOGGER ::anchorzk::util::Logger::Instance()

#define ANCHORZK_LOG_ENABLED(level, category) \
    ANCHORZK_LOGGER.WillLog(::anchorzk::util::LogLevel::level, category)

// Operands of << are not evaluated when the entry would be dropped
#define ANCHORZK_LOG(level, category) \
    if (!ANCHORZK_LOG_ENABLED(level, category)) {} else \
        ::anchorzk::util::LogStream(::anchorzk::util::LogLevel::level, category, \
                                    __FILE__, __LINE__)

#define LOG_TRACE(category)   ANCHORZK_LOG(Trace, category)
#define LOG_DEBUG(category)   ANCHORZK_LOG(Debug, category)
#define LOG_INFO(category)    ANCHORZK_LOG(Info, category)
#define LOG_WARN(category)    ANCHORZK_LOG(Warn, category)
#define LOG_ERROR(category)   ANCHORZK_LOG(Error, category)

#define ANCHORZK_LOGF(level, category, ...) \
    do { \
        if (ANCHORZK_LOG_ENABLED(level, category)) { \
            ANCHORZK_LOGGER.LogF(::anchorzk::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  ANCHORZK_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ANCHORZK_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ANCHORZK_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ANCHORZK_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Helpers
// ============================================================================

/// Logs "<operation> started" on construction and
/// "<operation> finished in <n>ms" on destruction, both at Debug
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

    int64_t ElapsedMs() const;

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

} // namespace util
} // namespace anchorzk

#endif // ANCHORZK_UTIL_LOGGING_H
