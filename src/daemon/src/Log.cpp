/*
 * MicrogridControl — Logging (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <sys/time.h>
#include <system_error>

namespace mgc {

namespace fs = std::filesystem;

static size_t fileSizeOrZero(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    return ec ? 0u : static_cast<size_t>(sz);
}

// "2025-09-20 14:22:11.042 [W] "
static void formatPrefix(LogLevel lvl, char* buf, size_t n) {
    struct timeval tv{};
    ::gettimeofday(&tv, nullptr);
    std::tm tmv{};
    time_t secs = tv.tv_sec;
    localtime_r(&secs, &tmv);
    char ts[32];
    if (std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        std::snprintf(ts, sizeof(ts), "1970-01-01 00:00:00");
    }
    const char tag = "EWIDT"[static_cast<int>(lvl)];
    std::snprintf(buf, n, "%s.%03d [%c] ", ts, static_cast<int>(tv.tv_usec / 1000), tag);
}

const char* toString(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "info";
}

std::optional<LogLevel> logLevelFromString(const std::string& s) {
    const std::string v = util::to_lower(util::trim(s));
    if (v == "error")                   return LogLevel::Error;
    if (v == "warn" || v == "warning")  return LogLevel::Warn;
    if (v == "info")                    return LogLevel::Info;
    if (v == "debug")                   return LogLevel::Debug;
    if (v == "trace")                   return LogLevel::Trace;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::closeFileUnlocked() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio) {
    setLevel(lvl);
    mirror_.store(mirrorToStdio);
    setFile(logFilePath);
}

void Logger::setMirrorToStdio(bool on) {
    mirror_.store(on);
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
    filePath_ = path;
    currentSize_ = 0;
    if (filePath_.empty()) return;

    util::ensure_parent_dirs(filePath_);
    openFileIfNeeded();
    rotateIfDueUnlocked(0);
}

void Logger::setLevel(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::enableRotation(size_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mtx_);
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles;
    if (!filePath_.empty()) {
        currentSize_ = fileSizeOrZero(filePath_);
        rotateIfDueUnlocked(0);
    }
}

void Logger::openFileIfNeeded() {
    if (file_ || filePath_.empty()) return;
    file_ = std::fopen(filePath_.c_str(), "a");
    if (!file_) {
        std::fprintf(stderr, "mgcd: cannot open log file '%s': %s\n", filePath_.c_str(), std::strerror(errno));
        mirror_.store(true);
        return;
    }
    currentSize_ = fileSizeOrZero(filePath_);
}

void Logger::rotateIfDueUnlocked(size_t incomingBytes) {
    if (maxBytes_ == 0 || maxFiles_ <= 0 || filePath_.empty()) return;
    if (currentSize_ + incomingBytes <= maxBytes_) return;
    rotateFilesUnlocked();
    openFileIfNeeded();
    currentSize_ = 0;
}

void Logger::rotateFilesUnlocked() {
    closeFileUnlocked();
    std::error_code ec;
    // mgcd.log.(N-1) -> .N ... mgcd.log -> .1
    for (int i = maxFiles_ - 1; i >= 0; --i) {
        const std::string src = i == 0 ? filePath_ : filePath_ + "." + std::to_string(i);
        const std::string dst = filePath_ + "." + std::to_string(i + 1);
        if (fs::exists(src, ec)) {
            fs::remove(dst, ec);
            fs::rename(src, dst, ec);
        }
    }
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (!enabled(lvl)) return;
    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (!enabled(lvl)) return;

    char prefix[48];
    formatPrefix(lvl, prefix, sizeof(prefix));

    char msg[2048];
    std::vsnprintf(msg, sizeof(msg), fmt, ap);

    std::string line(prefix);
    line += msg;
    if (line.back() != '\n') line.push_back('\n');

    std::lock_guard<std::mutex> lock(mtx_);
    openFileIfNeeded();
    rotateIfDueUnlocked(line.size());

    if (file_) {
        std::fwrite(line.data(), 1, line.size(), file_);
        std::fflush(file_);
        currentSize_ += line.size();
    }
    if (mirror_.load() || !file_) {
        FILE* out = (lvl <= LogLevel::Warn) ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
}

} // namespace mgc
