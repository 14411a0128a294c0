// src/capture/capture_sink.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "capture_record.hpp"
#include "types/error_codes/result.hpp"

namespace radiohal {

/**
 * @brief Destination of capture records
 */
class ICaptureSink {
   public:
    virtual ~ICaptureSink() = default;

    /**
     * @brief Append one record
     *
     * @param record Record to store
     * @return Result kIoError if the record could not be stored
     */
    virtual Result Append(const CaptureRecord& record) = 0;
};

/**
 * @brief Capture sink keeping records in memory
 *
 * With a capacity set, appends beyond it fail with kIoError (storage full)
 * and the record is discarded.
 */
class MemoryCaptureSink : public ICaptureSink {
   public:
    /**
     * @param capacity Maximum number of records, 0 for unbounded
     */
    explicit MemoryCaptureSink(size_t capacity = 0) : capacity_(capacity) {}

    Result Append(const CaptureRecord& record) override {
        if (capacity_ != 0 && records_.size() >= capacity_) {
            return Result::Error(RadioErrorCode::kIoError,
                                 "Capture storage full");
        }
        records_.push_back(record);
        return Result::Success();
    }

    const std::vector<CaptureRecord>& getRecords() const { return records_; }

    size_t getCapacity() const { return capacity_; }

   private:
    size_t capacity_;
    std::vector<CaptureRecord> records_;
};

}  // namespace radiohal
