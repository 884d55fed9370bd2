#include <gtest/gtest.h>
#include "muxbus/encoders/binary_encoder.hpp"

#include <string>
#include <vector>

using muxbus::BinaryEncoder;
using muxbus::Frame;
using muxbus::MakePacket;

// Test the exact byte layout of a small frame
TEST(BinaryEncoderTest, WireLayout) {
    BinaryEncoder codec;
    const auto bytes = codec.Encode(Frame{"ab", {MakePacket("x"), MakePacket("")}});

    const std::vector<uint8_t> expected = {
        0x02, 0x00,               // name length
        'a', 'b',                 // name
        0x02, 0x00, 0x00, 0x00,   // packet count
        0x01, 0x00, 0x00, 0x00,   // packet 0 length
        'x',
        0x00, 0x00, 0x00, 0x00    // packet 1 length (empty)
    };
    EXPECT_EQ(bytes, expected);
}

// Test that decoding restores channel name and packet order
TEST(BinaryEncoderTest, RoundTripPreservesOrder) {
    BinaryEncoder codec;
    const Frame frame{"scores", {MakePacket("first"), MakePacket("second"), MakePacket("third")}};

    const auto decoded = codec.Decode(codec.Encode(frame));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, frame);
}

// Test that a frame with no packets is representable
TEST(BinaryEncoderTest, EmptyFrame) {
    BinaryEncoder codec;
    const Frame frame{"idle", {}};

    const auto bytes = codec.Encode(frame);
    EXPECT_EQ(bytes.size(), 2u + 4u + 4u);

    const auto decoded = codec.Decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->channel, "idle");
    EXPECT_TRUE(decoded->packets.empty());
}

// Test that binary payloads (including NUL) pass through untouched
TEST(BinaryEncoderTest, BinaryPayload) {
    BinaryEncoder codec;
    const Frame frame{"raw", {muxbus::Packet{0x00, 0xFF, 0x00, 0x7F}}};

    const auto decoded = codec.Decode(codec.Encode(frame));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->packets.front(), (muxbus::Packet{0x00, 0xFF, 0x00, 0x7F}));
}

// Test that every strict prefix of a valid frame is rejected
TEST(BinaryEncoderTest, RejectsTruncatedInput) {
    BinaryEncoder codec;
    const auto bytes = codec.Encode(Frame{"chat", {MakePacket("hello"), MakePacket("world")}});

    for (size_t length = 0; length < bytes.size(); ++length) {
        std::span<const uint8_t> prefix(bytes.data(), length);
        EXPECT_FALSE(codec.Decode(prefix).has_value()) << "prefix length " << length;
    }
}

// Test that bytes after the last packet are rejected
TEST(BinaryEncoderTest, RejectsTrailingBytes) {
    BinaryEncoder codec;
    auto bytes = codec.Encode(Frame{"chat", {MakePacket("hello")}});
    bytes.push_back(0x00);

    EXPECT_FALSE(codec.Decode(bytes).has_value());
}

// Test that a packet count the input cannot possibly hold is rejected
TEST(BinaryEncoderTest, RejectsImpossibleCount) {
    BinaryEncoder codec;
    const std::vector<uint8_t> bytes = {
        0x01, 0x00, 'c',
        0xFF, 0xFF, 0xFF, 0xFF    // four billion packets, no bodies
    };

    EXPECT_FALSE(codec.Decode(bytes).has_value());
}

// Test that a name longer than the u16 prefix cannot be encoded
TEST(BinaryEncoderTest, RejectsOversizedName) {
    BinaryEncoder codec;
    const Frame frame{std::string(70'000, 'n'), {MakePacket("x")}};

    EXPECT_TRUE(codec.Encode(frame).empty());
}
