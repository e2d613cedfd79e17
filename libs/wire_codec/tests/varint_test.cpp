// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/varint.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace keeper::test {

class VarIntTest : public ::testing::Test {
protected:
    int32_t round_trip(int32_t value) {
        std::vector<uint8_t> buffer;
        write_varint(buffer, value);
        BufferReader reader(buffer);
        int32_t decoded = read_varint(reader);
        EXPECT_EQ(reader.remaining(), 0u);
        return decoded;
    }
};

// =============================================================================
// Encoding
// =============================================================================

TEST_F(VarIntTest, EncodesKnownValues) {
    std::vector<uint8_t> buffer;
    write_varint(buffer, 0);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0x00}));

    buffer.clear();
    write_varint(buffer, 127);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0x7F}));

    buffer.clear();
    write_varint(buffer, 128);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0x80, 0x01}));

    buffer.clear();
    write_varint(buffer, 300);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0xAC, 0x02}));

    buffer.clear();
    write_varint(buffer, 754);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0xF2, 0x05}));
}

TEST_F(VarIntTest, NegativeValuesUseFiveBytes) {
    std::vector<uint8_t> buffer;
    write_varint(buffer, -1);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0x0F}));
    EXPECT_EQ(varint_size(-1), 5u);
}

TEST_F(VarIntTest, SizeMatchesEncoding) {
    for (int32_t value : {0, 1, 127, 128, 16383, 16384, 2097151, 2097152,
                          std::numeric_limits<int32_t>::max()}) {
        std::vector<uint8_t> buffer;
        write_varint(buffer, value);
        EXPECT_EQ(buffer.size(), varint_size(value)) << "value=" << value;
    }
}

// =============================================================================
// Decoding
// =============================================================================

TEST_F(VarIntTest, RoundTripsBoundaryValues) {
    EXPECT_EQ(round_trip(0), 0);
    EXPECT_EQ(round_trip(127), 127);
    EXPECT_EQ(round_trip(128), 128);
    EXPECT_EQ(round_trip(300), 300);
    EXPECT_EQ(round_trip(2097151), 2097151);
    EXPECT_EQ(round_trip(std::numeric_limits<int32_t>::max() / 2),
              std::numeric_limits<int32_t>::max() / 2);
    EXPECT_EQ(round_trip(std::numeric_limits<int32_t>::max()),
              std::numeric_limits<int32_t>::max());
    EXPECT_EQ(round_trip(-1), -1);
}

TEST_F(VarIntTest, SixGroupsIsTooLong) {
    std::vector<uint8_t> buffer = {0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
    BufferReader reader(buffer);
    try {
        read_varint(reader);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_STREQ(e.what(), "varint too long");
    }
}

TEST_F(VarIntTest, TruncatedInputThrows) {
    std::vector<uint8_t> buffer = {0x80, 0x80};
    BufferReader reader(buffer);
    EXPECT_THROW(read_varint(reader), ProtocolError);
}

TEST_F(VarIntTest, ReadsConsecutiveValues) {
    std::vector<uint8_t> buffer;
    write_varint(buffer, 1);
    write_varint(buffer, 300);
    write_varint(buffer, 0);

    BufferReader reader(buffer);
    EXPECT_EQ(read_varint(reader), 1);
    EXPECT_EQ(read_varint(reader), 300);
    EXPECT_EQ(read_varint(reader), 0);
    EXPECT_EQ(reader.remaining(), 0u);
}

// =============================================================================
// Strings and fixed-width fields
// =============================================================================

TEST_F(VarIntTest, StringIsLengthPrefixed) {
    std::vector<uint8_t> buffer;
    write_string(buffer, "mc.example.org");

    ASSERT_EQ(buffer.size(), 15u);
    EXPECT_EQ(buffer[0], 14);
    EXPECT_EQ(buffer.back(), 'g');

    BufferReader reader(buffer);
    EXPECT_EQ(read_string(reader), "mc.example.org");
}

TEST_F(VarIntTest, StringKeepsUtf8Bytes) {
    std::string text = "\xC3\xA9t\xC3\xA9";  // "été"
    std::vector<uint8_t> buffer;
    write_string(buffer, text);
    EXPECT_EQ(buffer[0], 5);

    BufferReader reader(buffer);
    EXPECT_EQ(read_string(reader), text);
}

TEST_F(VarIntTest, EmptyString) {
    std::vector<uint8_t> buffer;
    write_string(buffer, "");
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0x00}));

    BufferReader reader(buffer);
    EXPECT_EQ(read_string(reader), "");
}

TEST_F(VarIntTest, StringLongerThanLimitThrows) {
    std::vector<uint8_t> buffer;
    write_string(buffer, std::string(64, 'x'));
    BufferReader reader(buffer);
    EXPECT_THROW(read_string(reader, 32), ProtocolError);
}

TEST_F(VarIntTest, NegativeStringLengthThrows) {
    std::vector<uint8_t> buffer;
    write_varint(buffer, -5);
    BufferReader reader(buffer);
    EXPECT_THROW(read_string(reader), ProtocolError);
}

TEST_F(VarIntTest, TruncatedStringThrows) {
    std::vector<uint8_t> buffer;
    write_varint(buffer, 10);
    buffer.push_back('a');
    BufferReader reader(buffer);
    EXPECT_THROW(read_string(reader), ProtocolError);
}

TEST_F(VarIntTest, U16IsBigEndian) {
    std::vector<uint8_t> buffer;
    write_u16_be(buffer, 25565);
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0x63, 0xDD}));
}

}  // namespace keeper::test
