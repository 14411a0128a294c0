#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "hal/hal.hpp"
#include "hal/native/native_hal.hpp"
#include "logger.hpp"

namespace radiohal {

/**
 * @brief File-based log handler implementation.
 *
 * Writes one line per message, prefixed with the time of the radio clock
 * as seconds and microseconds. With the native HAL this is the same
 * wall-clock time the capture writers stamp packets with, so a session
 * log lines up with its pcap records.
 *
 * Output is buffered by the stream; warnings and errors are flushed
 * immediately, other levels every flush interval.
 */
class FileLogHandler : public LogHandler {
   public:
    /**
     * @brief Constructor that opens a file for logging
     * @param filename The path to the log file
     * @param clock Clock stamping each line
     * @param append Whether to append to existing file (true) or overwrite (false)
     * @throw std::runtime_error if the file cannot be opened
     */
    explicit FileLogHandler(const std::string& filename,
                            hal::IClock& clock = hal::GetNativeHal(),
                            bool append = false);

    ~FileLogHandler() override;

    void Write(LogLevel level, const std::string& message) override;

    void Flush() override;

    /**
     * @brief Set the flush interval
     * @param interval Number of writes between forced flushes (default: 10)
     */
    void SetFlushInterval(size_t interval);

    const std::string& GetFilename() const { return filename_; }

   private:
    void WriteHeader();
    std::string FormatTime();

    std::ofstream file_stream_;
    std::string filename_;
    hal::IClock& clock_;
    std::mutex file_mutex_;
    std::string buffer_;         ///< Reusable buffer for log line construction
    size_t write_count_{0};      ///< Counter for writes since last flush
    size_t flush_interval_{10};  ///< Number of writes between forced flushes
};

/**
 * @brief Path of the session log kept next to a capture file
 *
 * Replaces the extension of the capture path with ".log", or appends it
 * when there is none: "out/link.pcap" becomes "out/link.log".
 */
std::string SessionLogPath(const std::string& capture_path);

/**
 * @brief Create a file log handler for a capture session
 * @param capture_path Capture file the session writes
 * @param clock Clock stamping each line
 * @return Unique pointer to the created file handler
 * @throw std::runtime_error if the log file cannot be opened
 */
std::unique_ptr<FileLogHandler> CreateSessionLogHandler(
    const std::string& capture_path, hal::IClock& clock = hal::GetNativeHal());

}  // namespace radiohal
