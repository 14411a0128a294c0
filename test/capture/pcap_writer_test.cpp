// test/capture/pcap_writer_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/stat.h>
#endif

#include "capture/pcap_writer.hpp"

namespace radiohal {
namespace test {

namespace {

std::vector<uint8_t> Bytes(const std::stringstream& stream) {
    const std::string data = stream.str();
    return std::vector<uint8_t>(data.begin(), data.end());
}

uint32_t ReadLe32(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

CaptureRecord ReceivedRecord() {
    CaptureRecord record;
    record.direction = CaptureDirection::kReceived;
    record.payload = {0xAA, 0xBB};
    record.info = PacketInfo(-60, 0x0102, std::chrono::microseconds(0), 2);
    record.timestamp = std::chrono::microseconds(3000123);
    return record;
}

constexpr size_t kGlobalHeaderLength = 24;
constexpr size_t kRecordHeaderLength = 16;

}  // namespace

class PcapWriterTest : public ::testing::Test {
   protected:
    std::stringstream stream_;
};

TEST_F(PcapWriterTest, GlobalHeaderLayout) {
    PcapWriter writer(stream_);
    ASSERT_TRUE(writer.WriteHeader());
    ASSERT_TRUE(writer.WriteHeader());

    std::vector<uint8_t> data = Bytes(stream_);
    ASSERT_EQ(data.size(), kGlobalHeaderLength);
    EXPECT_EQ(data[0], 0xD4);
    EXPECT_EQ(data[1], 0xC3);
    EXPECT_EQ(data[2], 0xB2);
    EXPECT_EQ(data[3], 0xA1);
    EXPECT_EQ(data[4], 2);
    EXPECT_EQ(data[6], 4);
    EXPECT_EQ(ReadLe32(data, 8), 0u);
    EXPECT_EQ(ReadLe32(data, 12), 0u);
    EXPECT_EQ(ReadLe32(data, 16), 0xFFFFu);
    EXPECT_EQ(ReadLe32(data, 20), 147u);
}

TEST_F(PcapWriterTest, ReceivedRecordWithPseudoHeader) {
    PcapWriter writer(stream_);
    ASSERT_TRUE(writer.Append(ReceivedRecord()));
    EXPECT_EQ(writer.getRecordCount(), 1u);

    std::vector<uint8_t> data = Bytes(stream_);
    const size_t frame_length = PcapRadioHeader::kLength + 2;
    ASSERT_EQ(data.size(),
              kGlobalHeaderLength + kRecordHeaderLength + frame_length);

    const size_t record = kGlobalHeaderLength;
    EXPECT_EQ(ReadLe32(data, record), 3u);
    EXPECT_EQ(ReadLe32(data, record + 4), 123u);
    EXPECT_EQ(ReadLe32(data, record + 8), frame_length);
    EXPECT_EQ(ReadLe32(data, record + 12), frame_length);

    const std::vector<uint8_t> frame(data.begin() + record + 16, data.end());
    EXPECT_EQ(frame, (std::vector<uint8_t>{PcapRadioHeader::kVersion, 1,
                                           PcapRadioHeader::kFlagInfoValid, 0,
                                           0xFF, 0xC4, 0x01, 0x02, 0xAA,
                                           0xBB}));
}

TEST_F(PcapWriterTest, SentRecordHasNoInfo) {
    PcapWriter writer(stream_);
    CaptureRecord record;
    record.direction = CaptureDirection::kSent;
    record.payload = {0x10};
    ASSERT_TRUE(writer.Append(record));

    std::vector<uint8_t> data = Bytes(stream_);
    const std::vector<uint8_t> frame(
        data.begin() + kGlobalHeaderLength + kRecordHeaderLength, data.end());
    EXPECT_EQ(frame, (std::vector<uint8_t>{1, 0, 0, 0, 0, 0, 0, 0, 0x10}));
}

TEST_F(PcapWriterTest, RawLinkTypeWritesPayloadOnly) {
    PcapWriter writer(stream_, PcapLinkType::kIeee802154);
    ASSERT_TRUE(writer.Append(ReceivedRecord()));

    std::vector<uint8_t> data = Bytes(stream_);
    EXPECT_EQ(ReadLe32(data, 20), 195u);
    ASSERT_EQ(data.size(), kGlobalHeaderLength + kRecordHeaderLength + 2);
    EXPECT_EQ(data[data.size() - 2], 0xAA);
    EXPECT_EQ(data[data.size() - 1], 0xBB);
}

TEST_F(PcapWriterTest, OversizedFrameIsTruncated) {
    PcapWriter writer(stream_, PcapLinkType::kIeee802154);
    CaptureRecord record;
    record.payload.assign(PcapWriter::kSnapLength + 10, 0x5A);
    ASSERT_TRUE(writer.Append(record));

    std::vector<uint8_t> data = Bytes(stream_);
    EXPECT_EQ(ReadLe32(data, kGlobalHeaderLength + 8), PcapWriter::kSnapLength);
    EXPECT_EQ(ReadLe32(data, kGlobalHeaderLength + 12),
              PcapWriter::kSnapLength + 10);
    EXPECT_EQ(data.size(), kGlobalHeaderLength + kRecordHeaderLength +
                               PcapWriter::kSnapLength);
}

TEST_F(PcapWriterTest, NegativeTimestampIsWrittenAsZero) {
    PcapWriter writer(stream_);
    CaptureRecord record = ReceivedRecord();
    record.timestamp = std::chrono::microseconds(-1500000);
    ASSERT_TRUE(writer.Append(record));

    std::vector<uint8_t> data = Bytes(stream_);
    EXPECT_EQ(ReadLe32(data, kGlobalHeaderLength), 0u);
    EXPECT_EQ(ReadLe32(data, kGlobalHeaderLength + 4), 0u);
}

TEST_F(PcapWriterTest, StreamFailureIsIoError) {
    stream_.setstate(std::ios::badbit);
    PcapWriter writer(stream_);

    Result result = writer.Append(ReceivedRecord());
    EXPECT_EQ(result.getErrorCode(), RadioErrorCode::kIoError);
    EXPECT_EQ(writer.getRecordCount(), 0u);
}

TEST(OpenPcapWriterTest, NoOutputConfigured) {
    auto writer = OpenPcapWriter(PcapOptions{});
    ASSERT_TRUE(writer);
    EXPECT_EQ(writer.getValue(), nullptr);
}

TEST(OpenPcapWriterTest, FileAndPipeConflict) {
    PcapOptions options;
    options.file = "capture.pcap";
    options.pipe = "capture.pipe";

    auto writer = OpenPcapWriter(options);
    EXPECT_EQ(writer.getErrorCode(), RadioErrorCode::kConfigurationError);
}

TEST(OpenPcapWriterTest, UnwritablePathIsIoError) {
    PcapOptions options;
    options.file = "/nonexistent-directory/capture.pcap";

    auto writer = OpenPcapWriter(options);
    EXPECT_EQ(writer.getErrorCode(), RadioErrorCode::kIoError);
}

TEST(OpenPcapWriterTest, WritesFileWithHeader) {
    const std::string path =
        ::testing::TempDir() + "radiohal_open_pcap_writer_test.pcap";
    PcapOptions options;
    options.file = path;

    {
        auto writer = OpenPcapWriter(options);
        ASSERT_TRUE(writer);
        ASSERT_NE(writer.getValue(), nullptr);
        ASSERT_TRUE(writer.getValue()->Append(ReceivedRecord()));
    }

    std::ifstream in(path, std::ios::binary);
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    EXPECT_EQ(data.size(), kGlobalHeaderLength + kRecordHeaderLength +
                               PcapRadioHeader::kLength + 2);
    std::remove(path.c_str());
}

#if defined(__unix__) || defined(__APPLE__)
TEST(OpenPcapWriterTest, PipeDeliversHeader) {
    const std::string path =
        ::testing::TempDir() + "radiohal_open_pcap_writer_test.pipe";
    // A stale regular file at the pipe path is replaced by the fifo
    std::ofstream(path) << "stale";

    std::vector<uint8_t> received;
    std::thread reader([&path, &received]() {
        struct stat info {};
        for (int attempt = 0; attempt < 500; ++attempt) {
            if (stat(path.c_str(), &info) == 0 && S_ISFIFO(info.st_mode)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        std::ifstream in(path, std::ios::binary);
        char header[kGlobalHeaderLength];
        in.read(header, sizeof(header));
        received.assign(header, header + in.gcount());
    });

    PcapOptions options;
    options.pipe = path;
    auto writer = OpenPcapWriter(options);
    reader.join();

    ASSERT_TRUE(writer);
    ASSERT_NE(writer.getValue(), nullptr);
    ASSERT_EQ(received.size(), kGlobalHeaderLength);
    EXPECT_EQ(ReadLe32(received, 0), 0xA1B2C3D4u);
    EXPECT_EQ(ReadLe32(received, 20), 147u);

    struct stat info {};
    ASSERT_EQ(stat(path.c_str(), &info), 0);
    EXPECT_TRUE(S_ISFIFO(info.st_mode));
    std::remove(path.c_str());
}
#endif

}  // namespace test
}  // namespace radiohal
