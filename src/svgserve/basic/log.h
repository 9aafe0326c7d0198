#pragma once
#include "spdlog/spdlog.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace SvgServe
{

enum LogLevel
{
    trace    = 0,
    debug    = 1,
    info     = 2,
    warn     = 3,
    err      = 4,
    critical = 5,
    off      = 6
};
using ErrorHandlerType = std::function<void(const std::string&)>;

class Logger {
public:
    struct LoggerInitOptions {
        static constexpr LogLevel kDefaultLogLevel                = LogLevel::info;
        static constexpr const char* kDefaultCustomLoggerName     = "svgserve";
        static constexpr const char* kDefaultLogOutputProgramName = "svgserve";
        static constexpr const char* kDefaultLogOutputFileExt     = ".log";
        static constexpr const char* kDefaultLogFormat            = "%^%Y-%m-%d %H:%M:%S.%e %l%$ [thread:%t]: %v";
        static constexpr std::size_t kDefaultLogFileLimitSize     = 10 * 1024 * 1024; // 10M
        static constexpr std::size_t kDefaultMaxLogFiles          = 5;
        std::string loggerName = kDefaultCustomLoggerName;
        // minimum log level
        std::optional<LogLevel> minimumLevel;
        // log output path, no file output when it's not set
        std::optional<std::string> logOutputPath;
        // log output filebasename
        std::optional<std::string> logOutputProgramName;
        // log file's ext
        std::optional<std::string> logOutputFileExt;
        // control logs' head format
        std::optional<std::string> logFormat;
        // single log file's limit size
        std::optional<std::size_t> logFileLimitSize;
        // rotated files kept besides the active one
        std::optional<std::size_t> maxLogFiles;
        // control log to console
        bool enableConsoleOutput = true;
        ErrorHandlerType errorHandler = nullptr;
    };

public:
    explicit Logger(std::string_view format_str = "%^[%L]%$ %v");
    ~Logger();

    template <typename T>
    inline void LogOutput(LogLevel level, const T& data) {
        loggerStorage->log(static_cast<spdlog::level::level_enum>(level), data);
    }

    template <typename... Args>
    inline void LogOutput(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        loggerStorage->log(static_cast<spdlog::level::level_enum>(level), fmt, std::forward<Args>(args)...);
    }

    // throw std::runtime_error when the log directory can't be prepared
    static void Initialize(LoggerInitOptions options, Logger* logger = s_defaultLogger);
    static void Release(Logger* logger = s_defaultLogger);

public:
    static Logger* s_defaultLogger;

private:
    ErrorHandlerType errorHandler;
    std::shared_ptr<spdlog::logger> loggerStorage = nullptr;
};

template <typename... Args>
inline std::string StringFormat(fmt::format_string<Args...> fmt, Args&&... args) {
    return fmt::format(fmt, std::forward<Args>(args)...);
}

constexpr const char* ShortFileName(const char* path) {
    const char* name = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') name = p + 1;
    }
    return name;
}
} // namespace SvgServe

#ifdef NO_SHORT_FILE_NAME
    #define LOG_FILE_NAME __FILE__
#else
    #define LOG_FILE_NAME SvgServe::ShortFileName(__FILE__)
#endif

#define STR_H(x)      #x
#define STR_HELPER(x) STR_H(x)

#ifndef DISABLE_SLOG
    #define SLOG(logger, logLevel, ...) (logger)->LogOutput(logLevel, __VA_ARGS__)
    #define SLOG_DEBUGINFO(logger, logLevel, ...)                                                                      \
        do {                                                                                                           \
            auto __debugInfo__ = SvgServe::StringFormat("[{}:{}"                                                      \
                                                        "(" STR_HELPER(__LINE__) ")] ",                                \
                                                        LOG_FILE_NAME, __func__);                                      \
            (logger)->LogOutput(logLevel, __debugInfo__ + SvgServe::StringFormat(__VA_ARGS__));                        \
        } while (0)
#else
    #define SLOG(logger, logLevel, ...)           (void)0
    #define SLOG_DEBUGINFO(logger, logLevel, ...) (void)0
#endif // !DISABLE_SLOG

#ifndef DISABLE_TRACE
    #define STRACE(...) SLOG_DEBUGINFO(SvgServe::Logger::s_defaultLogger, SvgServe::LogLevel::trace, __VA_ARGS__)
#else
    #define STRACE(...) (void)0
#endif

#define SDEBUG(...) SLOG(SvgServe::Logger::s_defaultLogger, SvgServe::LogLevel::debug, __VA_ARGS__)
#define SINFO(...)  SLOG(SvgServe::Logger::s_defaultLogger, SvgServe::LogLevel::info, __VA_ARGS__)
#define SWARN(...)  SLOG_DEBUGINFO(SvgServe::Logger::s_defaultLogger, SvgServe::LogLevel::warn, __VA_ARGS__)
#define SERR(...)   SLOG_DEBUGINFO(SvgServe::Logger::s_defaultLogger, SvgServe::LogLevel::err, __VA_ARGS__)
#define SFAIL(...)  SLOG_DEBUGINFO(SvgServe::Logger::s_defaultLogger, SvgServe::LogLevel::critical, __VA_ARGS__)

#if defined(DEBUG) && !defined(DISABLE_ASSERT)
    #define SASSERT(_check, ...)                                                                                       \
        if (!(_check)) {                                                                                               \
            auto __debugInfo__ = SvgServe::StringFormat("[{}:{}"                                                      \
                                                        "(" STR_HELPER(__LINE__) ")] [####check####:" #_check "] ",    \
                                                        LOG_FILE_NAME, __func__);                                      \
            throw std::runtime_error(__debugInfo__ + SvgServe::StringFormat(__VA_ARGS__));                             \
        }
#else
    #define SASSERT(_check, ...) (void)0
#endif

/*end of file*/
