#include <gtest/gtest.h>
#include "frame_codec.hpp"
#include "messages.hpp"
#include <string>
#include <vector>
#include <random>

using namespace bhumi;

TEST(FuzzTest, DecoderSurvivesRandomStreams) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> chunk(1, 64);

    for (int round = 0; round < 500; ++round) {
        FrameDecoder decoder(4096);
        try {
            for (int i = 0; i < 20; ++i) {
                Bytes data(static_cast<size_t>(chunk(rng)));
                for (auto& b : data) b = static_cast<uint8_t>(byte(rng));
                decoder.feed(data);
                while (auto frame = decoder.next()) {
                    EXPECT_LE(frame->payload.size(), 4096u);
                }
            }
        } catch (const FramingError&) {
            EXPECT_TRUE(decoder.failed());
        }
    }
}

TEST(FuzzTest, MessageDecodersRejectGarbageCleanly) {
    std::mt19937 rng(99);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> length(0, 300);

    for (int round = 0; round < 1000; ++round) {
        Bytes data(static_cast<size_t>(length(rng)));
        for (auto& b : data) b = static_cast<uint8_t>(byte(rng));

        // Only MessageError may escape a decoder.
        try { Hello::decode(data); } catch (const MessageError&) {}
        try { IAm::decode(data); } catch (const MessageError&) {}
        try { SendRequest::decode(data); } catch (const MessageError&) {}
        try { Deliver::decode(data); } catch (const MessageError&) {}
        try { Ack::decode(data); } catch (const MessageError&) {}
        try { SendResult::decode(data); } catch (const MessageError&) {}
        try { UpdateCommits::decode(data); } catch (const MessageError&) {}
        try { PresenceRecord::decode(data); } catch (const MessageError&) {}
    }
    SUCCEED();
}

TEST(FuzzTest, HugeDeclaredCountsRejected) {
    // I_AM claiming 65535 commits with none present.
    Bytes data(32 + 64, 0x00);
    data.push_back(0xFF);
    data.push_back(0xFF);
    EXPECT_THROW(IAm::decode(data), MessageError);

    // UPDATE_COMMITS claiming 65535 commits.
    EXPECT_THROW(UpdateCommits::decode(Bytes{0xFF, 0xFF}), MessageError);
}
