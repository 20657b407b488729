#include <gtest/gtest.h>
#include <sstream>
#include <streambuf>
#include "network/codec.hpp"
#include "test_utils.hpp"

using namespace sft::network;

namespace {

// Hands out one byte per underflow, so the stream never knows how much is left
class TrickleBuffer : public std::streambuf {
public:
    explicit TrickleBuffer(const std::vector<uint8_t>& data) : data_(data) {}

protected:
    int_type underflow() override {
        if (position_ >= data_.size()) {
            return traits_type::eof();
        }
        current_ = static_cast<char>(data_[position_++]);
        setg(&current_, &current_, &current_ + 1);
        return traits_type::to_int_type(current_);
    }

private:
    const std::vector<uint8_t>& data_;
    std::size_t position_ = 0;
    char current_ = 0;
};

} // namespace

class CodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
    }

    FileIncoming sample_message() const {
        FileData file_data;
        file_data.name = "a.txt";
        file_data.mime_type = "text/plain";
        file_data.size = 10;
        file_data.key = std::vector<uint8_t>(32, 0x11);
        for (size_t i = 0; i < file_data.hash.size(); ++i) {
            file_data.hash[i] = static_cast<uint8_t>(i);
        }
        file_data.data = std::vector<uint8_t>(38, 0xAB);
        return FileIncoming{file_data};
    }

    // Frame carrying only magic and a type tag
    std::vector<uint8_t> tag_only_frame(const std::string& type) const {
        std::vector<uint8_t> frame = {'S', 'F', 'T', '1'};
        frame.push_back(static_cast<uint8_t>(type.size() >> 8));
        frame.push_back(static_cast<uint8_t>(type.size() & 0xFF));
        frame.insert(frame.end(), type.begin(), type.end());
        return frame;
    }

    Codec codec;
};

TEST_F(CodecTest, FileIncomingRoundTrip) {
    const FileIncoming original = sample_message();

    Message decoded = codec.decode(codec.encode(original));

    const auto* incoming = std::get_if<FileIncoming>(&decoded);
    ASSERT_NE(incoming, nullptr);
    EXPECT_EQ(incoming->file_data.name, "a.txt");
    EXPECT_EQ(incoming->file_data.mime_type, "text/plain");
    EXPECT_EQ(incoming->file_data.size, 10u);
    EXPECT_EQ(incoming->file_data.key, original.file_data.key);
    EXPECT_EQ(incoming->file_data.hash, original.file_data.hash);
    EXPECT_EQ(incoming->file_data.data, original.file_data.data);
}

TEST_F(CodecTest, SerializeReportsBytesWritten) {
    std::ostringstream output(std::ios::binary);
    std::size_t written = codec.serialize(sample_message(), output);

    // magic + type + name + mime + size + key + hash + data
    const std::size_t expected = 4 + (2 + 13) + (4 + 5) + (4 + 10) + 8 + (2 + 32) + (2 + 32) + (8 + 38);
    EXPECT_EQ(written, expected);
    EXPECT_EQ(output.str().size(), expected);
}

TEST_F(CodecTest, FrameLayoutIsBigEndian) {
    std::vector<uint8_t> frame = codec.encode(sample_message());

    ASSERT_GE(frame.size(), 6u);
    EXPECT_EQ(std::string(frame.begin(), frame.begin() + 4), "SFT1");
    EXPECT_EQ(frame[4], 0x00);
    EXPECT_EQ(frame[5], 13);
    EXPECT_EQ(std::string(frame.begin() + 6, frame.begin() + 19), "file-incoming");
}

TEST_F(CodecTest, UnknownTypeDecodesAsUnrecognized) {
    std::vector<uint8_t> frame = tag_only_frame("ping");
    frame.push_back(0xDE);
    frame.push_back(0xAD);

    Message decoded = codec.decode(frame);

    const auto* other = std::get_if<Unrecognized>(&decoded);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(other->type, "ping");
    EXPECT_EQ(message_type(decoded), "ping");
}

TEST_F(CodecTest, UnrecognizedRoundTripsTag) {
    Message decoded = codec.decode(codec.encode(Unrecognized{"status"}));
    EXPECT_EQ(message_type(decoded), "status");
}

TEST_F(CodecTest, BadMagicRejected) {
    std::vector<uint8_t> frame = codec.encode(sample_message());
    frame[0] = 'X';
    EXPECT_THROW(codec.decode(frame), ProtocolError);
}

TEST_F(CodecTest, EmptyFrameRejected) {
    EXPECT_THROW(codec.decode(std::vector<uint8_t>{}), ProtocolError);
}

TEST_F(CodecTest, TruncatedFrameRejected) {
    std::vector<uint8_t> frame = codec.encode(sample_message());
    for (size_t cut : {frame.size() - 1, frame.size() / 2, std::size_t{10}}) {
        std::vector<uint8_t> truncated(frame.begin(), frame.begin() + cut);
        EXPECT_THROW(codec.decode(truncated), ProtocolError) << "cut at " << cut;
    }
}

TEST_F(CodecTest, TrailingBytesRejected) {
    std::vector<uint8_t> frame = codec.encode(sample_message());
    frame.push_back(0x00);
    EXPECT_THROW(codec.decode(frame), ProtocolError);
}

TEST_F(CodecTest, WrongDigestLengthRejected) {
    // file-incoming with empty name/mime, size 0, empty key and a 31-byte hash
    std::vector<uint8_t> frame = tag_only_frame(FILE_INCOMING_TYPE);
    frame.insert(frame.end(), {0, 0, 0, 0});
    frame.insert(frame.end(), {0, 0, 0, 0});
    frame.insert(frame.end(), 8, 0);
    frame.insert(frame.end(), {0, 0});
    frame.insert(frame.end(), {0, 31});
    frame.insert(frame.end(), 31, 0xAA);
    frame.insert(frame.end(), 8, 0);

    EXPECT_THROW(codec.decode(frame), ProtocolError);
}

TEST_F(CodecTest, CiphertextAboveFrameLimitRejected) {
    Codec small(16);
    FileIncoming message = sample_message();

    EXPECT_THROW(small.encode(message), ProtocolError);

    // A frame declaring more ciphertext than the limit is refused before allocation
    std::vector<uint8_t> frame = codec.encode(message);
    EXPECT_THROW(small.decode(frame), ProtocolError);
}

TEST_F(CodecTest, OversizedTextFieldRejected) {
    FileIncoming message = sample_message();
    message.file_data.name = std::string(Codec::MAX_TEXT_FIELD + 1, 'n');
    EXPECT_THROW(codec.encode(message), ProtocolError);
}

TEST_F(CodecTest, ShortFrameDeclaringHugeCiphertextRejected) {
    FileIncoming message = sample_message();
    message.file_data.data.clear();
    std::vector<uint8_t> frame = codec.encode(message);

    // Final u64 is the ciphertext length
    const uint64_t declared = uint64_t{1} << 31;
    ASSERT_LE(declared, codec.max_frame_size());
    for (int i = 0; i < 8; ++i) {
        frame[frame.size() - 8 + i] = static_cast<uint8_t>(declared >> (56 - 8 * i));
    }
    frame.insert(frame.end(), {0xAA, 0xBB, 0xCC});

    try {
        codec.decode(frame);
        FAIL() << "Expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("Truncated frame"), std::string::npos);
    }
}

TEST_F(CodecTest, DeclaredKeyLongerThanFrameRejected) {
    // file-incoming with empty name/mime, size 0 and a key claiming 65535 bytes
    std::vector<uint8_t> frame = tag_only_frame(FILE_INCOMING_TYPE);
    frame.insert(frame.end(), {0, 0, 0, 0});
    frame.insert(frame.end(), {0, 0, 0, 0});
    frame.insert(frame.end(), 8, 0);
    frame.insert(frame.end(), {0xFF, 0xFF});
    frame.insert(frame.end(), 4, 0x11);

    EXPECT_THROW(codec.decode(frame), ProtocolError);
}

TEST_F(CodecTest, DeclaredNameLongerThanFrameRejected) {
    std::vector<uint8_t> frame = tag_only_frame(FILE_INCOMING_TYPE);
    frame.insert(frame.end(), {0x00, 0x00, 0xEA, 0x60});  // 60000 bytes
    frame.insert(frame.end(), {'a', 'b'});

    EXPECT_THROW(codec.decode(frame), ProtocolError);
}

TEST_F(CodecTest, StreamWithoutSizeHintStillDecodes) {
    FileIncoming original = sample_message();
    original.file_data.data = std::vector<uint8_t>(Codec::READ_CHUNK_SIZE * 2 + 5, 0x3C);
    const std::vector<uint8_t> frame = codec.encode(original);

    TrickleBuffer buffer(frame);
    std::istream input(&buffer);
    Message decoded = codec.deserialize(input);

    const auto* incoming = std::get_if<FileIncoming>(&decoded);
    ASSERT_NE(incoming, nullptr);
    EXPECT_EQ(incoming->file_data.data, original.file_data.data);
    EXPECT_EQ(incoming->file_data.key, original.file_data.key);
}

TEST_F(CodecTest, StreamWithoutSizeHintDetectsTruncation) {
    std::vector<uint8_t> frame = codec.encode(sample_message());
    frame.resize(frame.size() - 3);

    TrickleBuffer buffer(frame);
    std::istream input(&buffer);
    EXPECT_THROW(codec.deserialize(input), ProtocolError);
}
