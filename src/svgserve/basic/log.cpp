#include "log.h"
#include "filesystem_utils.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <iostream>
#include <vector>

namespace SvgServe
{
namespace details
{
void PrepareLogdir(const std::string& logPath) {
    std::error_code ec;
    std_fs::create_directories(logPath, ec);
    if (!std_fs::is_directory(logPath)) {
        throw std::runtime_error(StringFormat("create log directory {} failed:{}", logPath, ec.message()));
    }
}

std::shared_ptr<spdlog::logger> MakeConsoleLogger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}
} // namespace details

static Logger s_logger;
Logger* Logger::s_defaultLogger = &s_logger;

Logger::Logger(std::string_view format_str) :
loggerStorage(details::MakeConsoleLogger(Logger::LoggerInitOptions::kDefaultCustomLoggerName)) {
    loggerStorage->set_pattern(std::string(format_str));
    loggerStorage->set_level(static_cast<spdlog::level::level_enum>(LoggerInitOptions::kDefaultLogLevel));
}

Logger::~Logger() {
    Release(this);
}

void Logger::Initialize(LoggerInitOptions options, Logger* logger) {
    if (!logger) return;
    std::vector<spdlog::sink_ptr> sinks;
    if (options.enableConsoleOutput) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (options.logOutputPath.has_value()) {
        auto& logPath = options.logOutputPath.value();
        details::PrepareLogdir(logPath);
        auto fileName = (std_fs::path(logPath) /
                         (options.logOutputProgramName.value_or(LoggerInitOptions::kDefaultLogOutputProgramName) +
                          options.logOutputFileExt.value_or(LoggerInitOptions::kDefaultLogOutputFileExt)))
                            .string();
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                fileName, options.logFileLimitSize.value_or(LoggerInitOptions::kDefaultLogFileLimitSize),
                options.maxLogFiles.value_or(LoggerInitOptions::kDefaultMaxLogFiles)));
        } catch (const spdlog::spdlog_ex& e) {
            throw std::runtime_error(StringFormat("open log file {} failed:{}", fileName, e.what()));
        }
    }
    auto newLogger = std::make_shared<spdlog::logger>(options.loggerName, sinks.begin(), sinks.end());
    newLogger->set_pattern(options.logFormat.value_or(LoggerInitOptions::kDefaultLogFormat));
    newLogger->set_level(
        static_cast<spdlog::level::level_enum>(options.minimumLevel.value_or(LoggerInitOptions::kDefaultLogLevel)));
    newLogger->flush_on(spdlog::level::warn);
    logger->errorHandler = options.errorHandler;
    if (logger->errorHandler) {
        newLogger->set_error_handler([handler = logger->errorHandler](const std::string& msg) { handler(msg); });
    }
    if (logger->loggerStorage) logger->loggerStorage->flush();
    logger->loggerStorage = std::move(newLogger);
}

void Logger::Release(Logger* logger) {
    if (!logger || !logger->loggerStorage) return;
    try {
        logger->loggerStorage->flush();
    } catch (const std::exception& e) {
        std::cerr << "flush logger failed:" << e.what() << std::endl;
    }
}

} // namespace SvgServe
