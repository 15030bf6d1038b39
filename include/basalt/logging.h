/**
 * Component logging for the storage core
 *
 *   BASALT_LOG_TAG(BlockPruner);
 *   BASALT_LOG_WARN(BlockPruner) << "segment " << location << " failed";
 *
 * INFO, WARN and ERROR statements are always compiled and filtered by
 * BASALT_MIN_LOG_LEVEL. TRACE and DEBUG statements compile to nothing
 * unless BASALT_ENABLE_DEBUG_LOGGING is defined.
 *
 * The BASALT_LOG_LEVEL environment variable (trace, debug, info, warn,
 * error, off) raises or lowers the runtime threshold once per process.
 * Records go to stderr as "[LEVEL] [Component] message".
 */

#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace basalt {
namespace logging {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    OFF   = 5
};

#ifndef BASALT_MIN_LOG_LEVEL
#define BASALT_MIN_LOG_LEVEL 2
#endif

// Statements below this level are removed at compile time
constexpr LogLevel kCompiledMinLevel = static_cast<LogLevel>(BASALT_MIN_LOG_LEVEL);

#ifdef BASALT_ENABLE_DEBUG_LOGGING
constexpr bool kDebugStatementsCompiled = true;
#else
constexpr bool kDebugStatementsCompiled = false;
#endif

template <LogLevel Level>
constexpr bool IsCompiledIn() {
    if (Level < kCompiledMinLevel) return false;
    return Level >= LogLevel::INFO || kDebugStatementsCompiled;
}

// A named source of log records, declared once per file with BASALT_LOG_TAG
struct LogTag {
    const char* component;

    constexpr explicit LogTag(const char* name) : component(name) {}
};

class Logger {
public:
    static Logger& Get() {
        static Logger logger;
        return logger;
    }

    bool Enabled(LogLevel level) const { return level >= threshold_; }

    void Emit(const LogTag& tag, LogLevel level, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << '[' << LevelName(level) << "] [" << tag.component << "] " << text
                  << '\n';
    }

private:
    Logger() : threshold_(ThresholdFromEnvironment()) {}

    static LogLevel ThresholdFromEnvironment() {
        const char* value = std::getenv("BASALT_LOG_LEVEL");
        if (value == nullptr) return kCompiledMinLevel;
        static const char* const kNames[] = {"trace", "debug", "info", "warn", "error", "off"};
        for (int i = 0; i <= static_cast<int>(LogLevel::OFF); ++i) {
            if (std::strcmp(value, kNames[i]) == 0) return static_cast<LogLevel>(i);
        }
        return kCompiledMinLevel;
    }

    static const char* LevelName(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::OFF: break;
        }
        return "OFF";
    }

    const LogLevel threshold_;
    std::mutex mutex_;
};

// Collects one record and hands it to the Logger when the statement ends
template <LogLevel Level, bool Compiled = IsCompiledIn<Level>()>
class LogRecord {
public:
    explicit LogRecord(const LogTag& tag)
        : tag_(tag), active_(Logger::Get().Enabled(Level)) {}

    ~LogRecord() {
        if (active_) Logger::Get().Emit(tag_, Level, text_.str());
    }

    template <typename T>
    LogRecord& operator<<(const T& value) {
        if (active_) text_ << value;
        return *this;
    }

private:
    const LogTag& tag_;
    const bool active_;
    std::ostringstream text_;
};

template <LogLevel Level>
class LogRecord<Level, false> {
public:
    explicit LogRecord(const LogTag&) {}

    template <typename T>
    LogRecord& operator<<(const T&) {
        return *this;
    }
};

} // namespace logging
} // namespace basalt

#define BASALT_LOG_TAG(name) \
    static constexpr ::basalt::logging::LogTag name##Tag(#name)

#define BASALT_LOG_TRACE(component) \
    ::basalt::logging::LogRecord<::basalt::logging::LogLevel::TRACE>(component##Tag)
#define BASALT_LOG_DEBUG(component) \
    ::basalt::logging::LogRecord<::basalt::logging::LogLevel::DEBUG>(component##Tag)
#define BASALT_LOG_INFO(component) \
    ::basalt::logging::LogRecord<::basalt::logging::LogLevel::INFO>(component##Tag)
#define BASALT_LOG_WARN(component) \
    ::basalt::logging::LogRecord<::basalt::logging::LogLevel::WARN>(component##Tag)
#define BASALT_LOG_ERROR(component) \
    ::basalt::logging::LogRecord<::basalt::logging::LogLevel::ERROR>(component##Tag)
