// Minimal leveled logging (header-only) for the asyncsftp core.
#pragma once
#include "RuntimeLogging.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace asyncsftp {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

// ASYNC_SFTP_LOG: unset/0 -> off, debug -> everything, anything else truthy -> info.
inline LogLevel logThreshold() {
    static const LogLevel level = [] {
        const std::string v = normalizedEnv("ASYNC_SFTP_LOG");
        if (v.empty() || v == "0" || v == "off" || v == "false")
            return LogLevel::Off;
        if (v == "debug" || v == "trace")
            return LogLevel::Debug;
        if (v == "warn" || v == "warning")
            return LogLevel::Warn;
        if (v == "error")
            return LogLevel::Error;
        return LogLevel::Info;
    }();
    return level;
}

inline bool logEnabled(LogLevel level) {
    const LogLevel threshold = logThreshold();
    return threshold != LogLevel::Off && level >= threshold;
}

inline const char *logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        break;
    }
    return "?";
}

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
inline void logf(LogLevel level, const char *fmt, ...) {
    if (!logEnabled(level))
        return;
    // Session, disk and callback threads all log; keep lines whole.
    static std::mutex mtx;
    std::lock_guard<std::mutex> lk(mtx);
    std::fprintf(stderr, "[asyncsftp][%s] ", logLevelName(level));
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace asyncsftp

#define LOGD(fmt, ...)                                                         \
    do {                                                                       \
        if (asyncsftp::logEnabled(asyncsftp::LogLevel::Debug))                 \
            asyncsftp::logf(asyncsftp::LogLevel::Debug, fmt, ##__VA_ARGS__);   \
    } while (0)

#define LOGI(fmt, ...)                                                         \
    do {                                                                       \
        if (asyncsftp::logEnabled(asyncsftp::LogLevel::Info))                  \
            asyncsftp::logf(asyncsftp::LogLevel::Info, fmt, ##__VA_ARGS__);    \
    } while (0)

#define LOGW(fmt, ...)                                                         \
    do {                                                                       \
        if (asyncsftp::logEnabled(asyncsftp::LogLevel::Warn))                  \
            asyncsftp::logf(asyncsftp::LogLevel::Warn, fmt, ##__VA_ARGS__);    \
    } while (0)

#define LOGE(fmt, ...)                                                         \
    do {                                                                       \
        if (asyncsftp::logEnabled(asyncsftp::LogLevel::Error))                 \
            asyncsftp::logf(asyncsftp::LogLevel::Error, fmt, ##__VA_ARGS__);   \
    } while (0)
