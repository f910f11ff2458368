#include <gtest/gtest.h>
#include "frame_codec.hpp"

using namespace bhumi;

TEST(FrameCodecTest, EncodesBigEndianHeader) {
    Frame frame{MessageType::SEND, Bytes{0xAA, 0xBB, 0xCC}};
    Bytes wire = FrameCodec::encode(frame);

    ASSERT_EQ(wire.size(), FrameCodec::HEADER_SIZE + 3);
    EXPECT_EQ(wire[0], 0x00);
    EXPECT_EQ(wire[1], 0x03);
    EXPECT_EQ(wire[2], 0x00);
    EXPECT_EQ(wire[3], 0x00);
    EXPECT_EQ(wire[4], 0x00);
    EXPECT_EQ(wire[5], 0x03);
    EXPECT_EQ(wire[6], 0xAA);
    EXPECT_EQ(wire[8], 0xCC);
}

TEST(FrameCodecTest, EmptyKeepalive) {
    Bytes wire = FrameCodec::encode(Frame{MessageType::KEEPALIVE, {}});
    EXPECT_EQ(wire, (Bytes{0x00, 0x06, 0x00, 0x00, 0x00, 0x00}));
}

TEST(FrameCodecTest, EncodeRejectsOversizedPayload) {
    Frame frame{MessageType::ACK, Bytes(17, 0)};
    EXPECT_THROW(FrameCodec::encode(frame, 16), FramingError);
}

TEST(FrameCodecTest, KnownTypes) {
    EXPECT_FALSE(FrameCodec::is_known_type(0));
    for (uint16_t t = 1; t <= 9; ++t) {
        EXPECT_TRUE(FrameCodec::is_known_type(t)) << t;
    }
    EXPECT_FALSE(FrameCodec::is_known_type(10));
    EXPECT_FALSE(FrameCodec::is_known_type(0xFFFF));
}

TEST(FrameDecoderTest, ByteAtATime) {
    Bytes wire = FrameCodec::encode(Frame{MessageType::DELIVER, Bytes{1, 2, 3, 4, 5}});
    FrameDecoder decoder;

    for (size_t i = 0; i + 1 < wire.size(); ++i) {
        decoder.feed(&wire[i], 1);
        EXPECT_FALSE(decoder.next().has_value());
    }
    decoder.feed(&wire.back(), 1);

    auto frame = decoder.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->type, MessageType::DELIVER);
    EXPECT_EQ(frame->payload, (Bytes{1, 2, 3, 4, 5}));
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, SeveralFramesInOneChunk) {
    Bytes chunk = FrameCodec::encode(Frame{MessageType::KEEPALIVE, {}});
    Bytes second = FrameCodec::encode(Frame{MessageType::ACK, Bytes{9, 9}});
    Bytes third = FrameCodec::encode(Frame{MessageType::PRESENCE, Bytes{7}});
    chunk.insert(chunk.end(), second.begin(), second.end());
    chunk.insert(chunk.end(), third.begin(), third.begin() + 4);

    FrameDecoder decoder;
    decoder.feed(chunk);

    auto f1 = decoder.next();
    auto f2 = decoder.next();
    ASSERT_TRUE(f1 && f2);
    EXPECT_EQ(f1->type, MessageType::KEEPALIVE);
    EXPECT_TRUE(f1->payload.empty());
    EXPECT_EQ(f2->type, MessageType::ACK);
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.buffered(), 4u);

    decoder.feed(third.data() + 4, third.size() - 4);
    auto f3 = decoder.next();
    ASSERT_TRUE(f3.has_value());
    EXPECT_EQ(f3->type, MessageType::PRESENCE);
    EXPECT_EQ(f3->payload, Bytes{7});
}

TEST(FrameDecoderTest, UnknownTypeFailsPermanently) {
    FrameDecoder decoder;
    Bytes wire{0x00, 0x2A, 0x00, 0x00, 0x00, 0x00};
    decoder.feed(wire);

    EXPECT_THROW(decoder.next(), FramingError);
    EXPECT_TRUE(decoder.failed());
    EXPECT_THROW(decoder.next(), FramingError);
    EXPECT_THROW(decoder.feed(wire), FramingError);
}

TEST(FrameDecoderTest, OversizedDeclaredLengthFailsBeforeBody) {
    FrameDecoder decoder(1024);
    // Header only: the decoder must not wait for a body it will never accept.
    Bytes header{0x00, 0x03, 0x00, 0x00, 0x04, 0x01};
    decoder.feed(header);
    EXPECT_THROW(decoder.next(), FramingError);
}

TEST(FrameDecoderTest, MaxSizedFrameAccepted) {
    FrameDecoder decoder(64);
    decoder.feed(FrameCodec::encode(Frame{MessageType::SEND, Bytes(64, 0x11)}, 64));
    auto frame = decoder.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->payload.size(), 64u);
}

TEST(FrameDecoderTest, RunawayBufferRejected) {
    FrameDecoder decoder(16);
    Bytes junk(200, 0x00);
    EXPECT_THROW(decoder.feed(junk), FramingError);
    EXPECT_TRUE(decoder.failed());
}

TEST(FrameCodecTest, TypeNames) {
    EXPECT_STREQ(message_type_to_string(MessageType::I_AM), "I_AM");
    EXPECT_STREQ(message_type_to_string(MessageType::SEND_RESULT), "SEND_RESULT");
}
