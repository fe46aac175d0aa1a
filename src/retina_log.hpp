// =============================================================================
// Retina - Logging
// =============================================================================
// Level-filtered printf-style logging to stderr plus an optional file.
//   RLOG_INFO("session", "sent '%s' after %d attempt(s)", label, n);
// Line format: "12:34:56.789 INFO  [session] (T4242) message"
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

#include <sys/syscall.h>
#include <unistd.h>

namespace retina::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

namespace detail {
struct Sink {
    std::atomic<Level> min_level{Level::Info};
    std::mutex mutex;
    FILE* file = nullptr;
};

inline Sink& sink() {
    static Sink s;
    return s;
}
} // namespace detail

inline const char* levelName(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Accepts the [log] level names: trace, debug, info, warn, error, fatal
inline bool parseLevel(const std::string& s, Level& out) {
    static const struct { const char* name; Level level; } kNames[] = {
        {"trace", Level::Trace}, {"debug", Level::Debug}, {"info", Level::Info},
        {"warn", Level::Warn},   {"error", Level::Error}, {"fatal", Level::Fatal},
    };
    for (const auto& n : kNames) {
        if (s == n.name) { out = n.level; return true; }
    }
    return false;
}

inline void setLogLevel(Level l) { detail::sink().min_level = l; }
inline Level logLevel() { return detail::sink().min_level.load(); }

// Truncates: one log per run.
inline bool openLogFile(const std::string& path) {
    auto& s = detail::sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) fclose(s.file);
    s.file = fopen(path.c_str(), "w");
    return s.file != nullptr;
}

inline void closeLogFile() {
    auto& s = detail::sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) { fclose(s.file); s.file = nullptr; }
}

// Owns the file sink for the lifetime of a program run. An empty path
// logs to stderr only.
class ScopedLogFile {
public:
    explicit ScopedLogFile(const std::string& path)
        : open_(!path.empty() && openLogFile(path)) {}
    ~ScopedLogFile() { if (open_) closeLogFile(); }
    ScopedLogFile(const ScopedLogFile&) = delete;
    ScopedLogFile& operator=(const ScopedLogFile&) = delete;

    bool isOpen() const { return open_; }

private:
    bool open_ = false;
};

inline void write(Level level, const char* tag, const char* fmt, ...) {
    auto& s = detail::sink();
    if (level < s.min_level.load(std::memory_order_relaxed)) return;

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    int ms = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()).count() % 1000);
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);

    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    char line[2200];
    snprintf(line, sizeof(line), "%02d:%02d:%02d.%03d %s [%s] (T%ld) %s\n",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms, levelName(level), tag,
             (long)syscall(SYS_gettid), msg);

    std::lock_guard<std::mutex> lock(s.mutex);
    fputs(line, stderr);
    if (s.file) {
        fputs(line, s.file);
        fflush(s.file);
    }
}

} // namespace retina::log

#define RLOG_TRACE(tag, fmt, ...) retina::log::write(retina::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define RLOG_DEBUG(tag, fmt, ...) retina::log::write(retina::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define RLOG_INFO(tag, fmt, ...)  retina::log::write(retina::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define RLOG_WARN(tag, fmt, ...)  retina::log::write(retina::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define RLOG_ERROR(tag, fmt, ...) retina::log::write(retina::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define RLOG_FATAL(tag, fmt, ...) retina::log::write(retina::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
