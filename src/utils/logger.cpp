#include "logger.hpp"

namespace radiohal {

namespace {

std::unique_ptr<LogHandler> CreateDefaultHandler() {
#ifdef RADIOHAL_BUILD_ARDUINO
    return std::make_unique<SerialLogHandler>();
#else
    return std::make_unique<ConsoleLogHandler>();
#endif
}

}  // namespace

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarning:
            return "WARNING";
        case LogLevel::kError:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

Logger::Logger() : handler_(CreateDefaultHandler()) {}

void Logger::Reset() {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    min_log_level_ = LogLevel::kDebug;
    handler_ = CreateDefaultHandler();
}

void Logger::LogMessage(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    if (level >= min_log_level_ && handler_) {
        handler_->Write(level, message);
    }
}

// Global logger instance
Logger LOG;

}  // namespace radiohal
