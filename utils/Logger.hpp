#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>

namespace sm {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Unknown names fall back to Info.
inline LogLevel parseLogLevel(const std::string &name) {
    if (name == "DEBUG" || name == "debug")
        return LogLevel::Debug;
    if (name == "WARN" || name == "warn")
        return LogLevel::Warn;
    if (name == "ERROR" || name == "error")
        return LogLevel::Error;
    return LogLevel::Info;
}

inline LogLevel &globalLogLevel() {
    static LogLevel level = [] {
        const char *env = std::getenv("SM_LOG_LEVEL");
        return env ? parseLogLevel(env) : LogLevel::Info;
    }();
    return level;
}

inline void setLogLevel(LogLevel level) { globalLogLevel() = level; }

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(globalLogLevel());
}

// When set, every level goes to this stream instead of stdout/stderr.
inline std::ostream *&logStreamOverride() {
    static std::ostream *stream = nullptr;
    return stream;
}

inline void setLogStream(std::ostream *stream) { logStreamOverride() = stream; }

inline const char *levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

inline std::string currentTime() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T");
    return ss.str();
}

inline void log(LogLevel level, const std::string &msg,
                const char *file = nullptr, int line = 0) {
    if (!logEnabled(level))
        return;
    std::ostream *out = logStreamOverride();
    if (!out)
        out = (level == LogLevel::Error ? &std::cerr : &std::cout);
    *out << '[' << levelTag(level) << "] " << currentTime();
    if (file)
        *out << ' ' << file << ':' << line;
    *out << " " << msg << std::endl;
}

} // namespace sm

#define SM_LOG(level, msg) ::sm::log(level, msg, __FILE__, __LINE__)
