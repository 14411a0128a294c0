#include "file_log_handler.hpp"

#include <cinttypes>
#include <cstdio>
#include <stdexcept>

namespace radiohal {

FileLogHandler::FileLogHandler(const std::string& filename,
                               hal::IClock& clock, bool append)
    : filename_(filename), clock_(clock) {
    auto mode = append ? (std::ios::out | std::ios::app)
                       : (std::ios::out | std::ios::trunc);
    file_stream_.open(filename_, mode);

    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename_);
    }

    if (!append) {
        WriteHeader();
    }
}

FileLogHandler::~FileLogHandler() {
    if (file_stream_.is_open()) {
        Flush();
        file_stream_.close();
    }
}

void FileLogHandler::Write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(file_mutex_);

    buffer_.clear();
    buffer_ += "[";
    buffer_ += FormatTime();
    buffer_ += "] [";
    buffer_ += LogLevelToString(level);
    buffer_ += "] ";
    buffer_ += message;
    buffer_ += '\n';

    file_stream_.write(buffer_.c_str(),
                       static_cast<std::streamsize>(buffer_.length()));

    if (level >= LogLevel::kWarning ||
        (++write_count_ % flush_interval_ == 0)) {
        file_stream_.flush();
    }
}

void FileLogHandler::Flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    file_stream_.flush();
}

void FileLogHandler::SetFlushInterval(size_t interval) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    flush_interval_ = interval == 0 ? 1 : interval;
}

void FileLogHandler::WriteHeader() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::string header = "# radiohal session log\n";
    header += "# Started: " + FormatTime() + "\n";
    header += "# Format: [seconds.micros] [level] message\n";
    header += "\n";

    file_stream_.write(header.c_str(),
                       static_cast<std::streamsize>(header.length()));
    file_stream_.flush();
}

std::string FileLogHandler::FormatTime() {
    const uint64_t micros = clock_.Micros();
    char text[32];
    snprintf(text, sizeof(text), "%" PRIu64 ".%06" PRIu64, micros / 1000000,
             micros % 1000000);
    return text;
}

std::string SessionLogPath(const std::string& capture_path) {
    const size_t slash = capture_path.find_last_of('/');
    const size_t dot = capture_path.find_last_of('.');
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash) || dot == slash + 1) {
        return capture_path + ".log";
    }
    return capture_path.substr(0, dot) + ".log";
}

std::unique_ptr<FileLogHandler> CreateSessionLogHandler(
    const std::string& capture_path, hal::IClock& clock) {
    return std::make_unique<FileLogHandler>(SessionLogPath(capture_path),
                                            clock);
}

}  // namespace radiohal
