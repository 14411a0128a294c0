/**
 * @file byte_operations.h
 * @brief Helper classes for binary serialization and deserialization
 * @details ByteSerializer appends integers to a growing buffer and
 * ByteDeserializer reads them back, in little or big endian byte order.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace radiohal {
namespace utils {

/**
  * @brief Helper class for serializing data into a byte buffer
  * @details Every write appends to the end of the referenced buffer
  */
class ByteSerializer {
   public:
    /**
      * @brief Constructs a ByteSerializer appending to a buffer
      * @param buffer Reference to the buffer where data will be written
      */
    explicit ByteSerializer(std::vector<uint8_t>& buffer) : buffer_(buffer) {}

    void WriteUint8(uint8_t value) { buffer_.push_back(value); }

    /**
      * @brief Writes a 16-bit unsigned integer in little-endian format
      */
    void WriteUint16(uint16_t value) {
        buffer_.push_back(value & 0xFF);
        buffer_.push_back((value >> 8) & 0xFF);
    }

    /**
      * @brief Writes a 32-bit unsigned integer in little-endian format
      */
    void WriteUint32(uint32_t value) {
        buffer_.push_back(value & 0xFF);
        buffer_.push_back((value >> 8) & 0xFF);
        buffer_.push_back((value >> 16) & 0xFF);
        buffer_.push_back((value >> 24) & 0xFF);
    }

    /**
      * @brief Writes a 16-bit unsigned integer in network (big-endian) order
      */
    void WriteUint16BE(uint16_t value) {
        buffer_.push_back((value >> 8) & 0xFF);
        buffer_.push_back(value & 0xFF);
    }

    /**
      * @brief Writes a 32-bit unsigned integer in network (big-endian) order
      */
    void WriteUint32BE(uint32_t value) {
        buffer_.push_back((value >> 24) & 0xFF);
        buffer_.push_back((value >> 16) & 0xFF);
        buffer_.push_back((value >> 8) & 0xFF);
        buffer_.push_back(value & 0xFF);
    }

    void WriteInt16BE(int16_t value) {
        WriteUint16BE(static_cast<uint16_t>(value));
    }

    /**
      * @brief Writes an array of bytes to the buffer
      * @param data Pointer to the data to write
      * @param length Number of bytes to write
      */
    void WriteBytes(const uint8_t* data, size_t length) {
        buffer_.insert(buffer_.end(), data, data + length);
    }

    size_t getSize() const { return buffer_.size(); }

   private:
    std::vector<uint8_t>& buffer_;  ///< Reference to the target buffer
};

/**
  * @brief Helper class for deserializing data from a byte buffer
  * @details Reads past the end return std::nullopt and consume nothing
  */
class ByteDeserializer {
   public:
    /**
      * @brief Constructs a ByteDeserializer over a buffer
      * @param data Start of the buffer to read from
      * @param size Size of the buffer
      */
    ByteDeserializer(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0) {}

    explicit ByteDeserializer(const std::vector<uint8_t>& buffer)
        : ByteDeserializer(buffer.data(), buffer.size()) {}

    std::optional<uint8_t> ReadUint8() {
        if (!CheckAvailable(1)) {
            return std::nullopt;
        }
        return data_[offset_++];
    }

    /**
      * @brief Reads a 16-bit unsigned integer in big-endian format
      */
    std::optional<uint16_t> ReadUint16BE() {
        if (!CheckAvailable(2)) {
            return std::nullopt;
        }
        uint16_t value = static_cast<uint16_t>(
            (static_cast<uint16_t>(data_[offset_]) << 8) |
            static_cast<uint16_t>(data_[offset_ + 1]));
        offset_ += 2;
        return value;
    }

    /**
      * @brief Reads a 32-bit unsigned integer in big-endian format
      */
    std::optional<uint32_t> ReadUint32BE() {
        if (!CheckAvailable(4)) {
            return std::nullopt;
        }
        uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 24) |
                         (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                         (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                         static_cast<uint32_t>(data_[offset_ + 3]);
        offset_ += 4;
        return value;
    }

    std::optional<int16_t> ReadInt16BE() {
        std::optional<uint16_t> value = ReadUint16BE();
        if (!value) {
            return std::nullopt;
        }
        return static_cast<int16_t>(*value);
    }

    /**
      * @brief Gets the number of unread bytes in the buffer
      */
    size_t getBytesLeft() const { return size_ - offset_; }

    size_t getOffset() const { return offset_; }

   private:
    bool CheckAvailable(size_t bytes) const { return offset_ + bytes <= size_; }

    const uint8_t* data_;  ///< Source buffer, not owned
    size_t size_;
    size_t offset_;  ///< Current position in the buffer
};

}  // namespace utils
}  // namespace radiohal
