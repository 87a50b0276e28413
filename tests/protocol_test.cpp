#include "fastxfer/errors.hpp"
#include "fastxfer/protocol.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace fastxfer;

namespace {

// serves a fixed byte string in small reads to exercise reassembly
class StringReader : public ByteReader {
public:
    StringReader(std::string data, std::size_t max_read = 3) : data_(std::move(data)), max_read_(max_read) {}

    std::size_t read(char *buffer, std::size_t length) override {
        std::size_t n = std::min({length, max_read_, data_.size() - pos_});
        data_.copy(buffer, n, pos_);
        pos_ += n;
        return n;
    }

    std::size_t consumed() const { return pos_; }

private:
    std::string data_;
    std::size_t max_read_;
    std::size_t pos_ = 0;
};

ErrorKind decode_error_kind(const std::string &bytes) {
    StringReader reader(bytes);
    try {
        decode_header(reader);
    } catch (const TransferError &e) {
        return e.kind();
    }
    return ErrorKind::Advisory;
}

} // namespace

TEST(ProtocolTest, EncodesEmptyFileHeader) {
    std::string header = encode_header("a.bin", 0);
    const std::vector<unsigned char> expected{0x00, 0x05, 0x61, 0x2E, 0x62, 0x69, 0x6E, 0x00,
                                              0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    ASSERT_EQ(header.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(static_cast<unsigned char>(header[i]), expected[i]) << "byte " << i;
    }
}

TEST(ProtocolTest, SizeIsBigEndian) {
    std::string header = encode_header("x", 0x0102030405060708ull);
    ASSERT_EQ(header.size(), 2u + 1u + 8u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(static_cast<unsigned char>(header[3 + i]), i + 1);
    }
}

TEST(ProtocolTest, DecodesHeaderAndLeavesBodyUnread) {
    std::string name(300, 'n');
    std::string wire = encode_header(name, 123456789ull) + "BODY";
    StringReader reader(wire);

    TransferHeader header = decode_header(reader);
    EXPECT_EQ(header.name, name);
    EXPECT_EQ(header.size, 123456789ull);
    EXPECT_EQ(reader.consumed(), wire.size() - 4);
}

TEST(ProtocolTest, DecodesEmptyName) {
    StringReader reader(encode_header("", 42));
    TransferHeader header = decode_header(reader);
    EXPECT_TRUE(header.name.empty());
    EXPECT_EQ(header.size, 42u);
}

TEST(ProtocolTest, TruncatedHeaderIsProtocolError) {
    std::string wire = encode_header("file.dat", 99);
    EXPECT_EQ(decode_error_kind(""), ErrorKind::Protocol);
    EXPECT_EQ(decode_error_kind(wire.substr(0, 1)), ErrorKind::Protocol);
    EXPECT_EQ(decode_error_kind(wire.substr(0, 5)), ErrorKind::Protocol);
    EXPECT_EQ(decode_error_kind(wire.substr(0, wire.size() - 1)), ErrorKind::Protocol);
}

TEST(ProtocolTest, OverlongNameIsSetupError) {
    try {
        encode_header(std::string(kMaxNameLength + 1, 'a'), 1);
        FAIL() << "expected TransferError";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Setup);
    }
    EXPECT_NO_THROW(encode_header(std::string(kMaxNameLength, 'a'), 1));
}
