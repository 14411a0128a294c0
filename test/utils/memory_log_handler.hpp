// test/utils/memory_log_handler.hpp
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "utils/logger.hpp"

namespace radiohal {
namespace test {

/**
 * @brief Log handler keeping lines in a shared buffer for assertions
 */
class MemoryLogHandler : public LogHandler {
   public:
    using Lines = std::vector<std::pair<LogLevel, std::string>>;

    explicit MemoryLogHandler(std::shared_ptr<Lines> lines)
        : lines_(std::move(lines)) {}

    void Write(LogLevel level, const std::string& message) override {
        lines_->emplace_back(level, message);
    }

    void Flush() override {}

   private:
    std::shared_ptr<Lines> lines_;
};

/**
 * @brief Logger wired to a MemoryLogHandler
 */
class CapturingLogger {
   public:
    CapturingLogger() : lines_(std::make_shared<MemoryLogHandler::Lines>()) {
        logger_.SetHandler(std::make_unique<MemoryLogHandler>(lines_));
    }

    Logger& get() { return logger_; }

    const MemoryLogHandler::Lines& lines() const { return *lines_; }

    bool Contains(LogLevel level, const std::string& fragment) const {
        for (const auto& line : *lines_) {
            if (line.first == level &&
                line.second.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

   private:
    std::shared_ptr<MemoryLogHandler::Lines> lines_;
    Logger logger_;
};

}  // namespace test
}  // namespace radiohal
