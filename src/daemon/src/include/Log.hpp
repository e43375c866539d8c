/*
 * MicrogridControl — Logging (header)
 * - Process-wide logger; optional file output with size-based rotation
 * - printf-style macros so hot paths (watchdog, poll loop) stay cheap
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace mgc {

enum class LogLevel {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Trace = 4   // per-request and per-tick detail
};

const char* toString(LogLevel lvl);
std::optional<LogLevel> logLevelFromString(const std::string& s);

/*
 * Logger: singleton, safe for concurrent writers.
 * The file is opened lazily and its directory created on demand. When the
 * file cannot be opened the logger falls back to stdio so nothing is lost.
 */
class Logger {
public:
    static Logger& instance();
    ~Logger();

    /*
     * Called once by mgcd at startup.
     *  - logFilePath: destination file (empty = stdio only)
     *  - lvl: minimum severity to emit
     *  - mirrorToStdio: also print (warnings/errors go to stderr)
     */
    void init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio);

    void setMirrorToStdio(bool on);
    void setFile(const std::string& path);
    void setLevel(LogLevel lvl);
    LogLevel level() const;
    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= level_.load(std::memory_order_relaxed); }

    /* Flushes and closes the file (idempotent). */
    void shutdown();

    /* Rotate when the file would exceed maxBytes; keep maxFiles old copies. 0 disables. */
    void enableRotation(size_t maxBytes, int maxFiles);

    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openFileIfNeeded();
    void closeFileUnlocked();
    void rotateIfDueUnlocked(size_t incomingBytes);
    void rotateFilesUnlocked();

    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};

    std::string filePath_;
    FILE*       file_{nullptr};
    std::atomic<bool> mirror_{true};

    size_t maxBytes_{5 * 1024 * 1024};
    int    maxFiles_{5};
    size_t currentSize_{0};
};

#define LOG_ERROR(fmt, ...) ::mgc::Logger::instance().write(::mgc::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::mgc::Logger::instance().write(::mgc::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::mgc::Logger::instance().write(::mgc::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::mgc::Logger::instance().write(::mgc::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) ::mgc::Logger::instance().write(::mgc::LogLevel::Trace, fmt, ##__VA_ARGS__)

} // namespace mgc
