#include <gtest/gtest.h>
#include "metrics.hpp"
#include "response_cache.hpp"
#include "test_support.hpp"

using namespace bhumi;
using namespace bhumi::testing;
using namespace std::chrono_literals;

class ResponseCacheTest : public ::testing::Test {
protected:
    ResponseCache cache{1024};
    ResponseCache::Clock::time_point t0 = ResponseCache::Clock::now();
};

TEST_F(ResponseCacheTest, TakeEvicts) {
    Preimage p = random_preimage();
    cache.store(p, to_bytes("reply"), 60s, t0);

    auto hit = cache.take(p, t0 + 1s);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, to_bytes("reply"));
    EXPECT_FALSE(cache.take(p, t0 + 2s).has_value());
}

TEST_F(ResponseCacheTest, PeekKeeps) {
    Preimage p = random_preimage();
    cache.store(p, to_bytes("reply"), 60s, t0);

    EXPECT_TRUE(cache.peek(p, t0).has_value());
    EXPECT_TRUE(cache.peek(p, t0).has_value());
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResponseCacheTest, ExpiredEntriesNeverReturned) {
    Preimage p = random_preimage();
    cache.store(p, to_bytes("reply"), 10s, t0);

    EXPECT_FALSE(cache.peek(p, t0 + 10s).has_value());
    EXPECT_EQ(cache.size(), 0u);

    cache.store(p, to_bytes("reply"), 10s, t0);
    EXPECT_FALSE(cache.take(p, t0 + 11s).has_value());
}

TEST_F(ResponseCacheTest, SweepRemovesOnlyExpired) {
    cache.store(random_preimage(), to_bytes("a"), 5s, t0);
    cache.store(random_preimage(), to_bytes("b"), 5s, t0);
    cache.store(random_preimage(), to_bytes("c"), 50s, t0);

    EXPECT_EQ(cache.sweep(t0 + 6s), 2u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResponseCacheTest, UploadReplacesPreviousUpload) {
    Id52 bob = filled_id(0xB0);
    Preimage first = random_preimage();
    Preimage second = random_preimage();

    EXPECT_EQ(cache.store_uploaded(bob, {{first, to_bytes("one")}}, 64, 60s, t0), 1u);
    EXPECT_EQ(cache.store_uploaded(bob, {{second, to_bytes("two")}}, 64, 60s, t0), 1u);

    EXPECT_FALSE(cache.peek(first, t0).has_value());
    EXPECT_EQ(*cache.peek(second, t0), to_bytes("two"));
}

TEST_F(ResponseCacheTest, UploadIsBounded) {
    std::vector<RecentResponse> uploads;
    for (int i = 0; i < 10; ++i) uploads.push_back({random_preimage(), to_bytes("r")});

    EXPECT_EQ(cache.store_uploaded(filled_id(1), uploads, 4, 60s, t0), 4u);
    EXPECT_EQ(cache.size(), 4u);
    EXPECT_TRUE(cache.peek(uploads[0].preimage, t0).has_value());
    EXPECT_FALSE(cache.peek(uploads[9].preimage, t0).has_value());
}

TEST_F(ResponseCacheTest, UploadsFromDifferentIdentitiesCoexist) {
    Preimage a = random_preimage();
    Preimage b = random_preimage();
    cache.store_uploaded(filled_id(1), {{a, to_bytes("a")}}, 64, 60s, t0);
    cache.store_uploaded(filled_id(2), {{b, to_bytes("b")}}, 64, 60s, t0);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(ResponseCacheTest, SweepForgetsDrainedUploadSlots) {
    Preimage taken = random_preimage();
    Preimage expiring = random_preimage();
    Preimage kept = random_preimage();

    cache.store_uploaded(filled_id(1), {{taken, to_bytes("t")}}, 64, 60s, t0);
    cache.store_uploaded(filled_id(2), {{expiring, to_bytes("e")}}, 64, 10s, t0);
    cache.store_uploaded(filled_id(3), {{kept, to_bytes("k")}}, 64, 60s, t0);
    EXPECT_EQ(cache.upload_slot_count(), 3u);

    ASSERT_TRUE(cache.take(taken, t0).has_value());
    EXPECT_EQ(cache.sweep(t0 + 10s), 1u);

    EXPECT_EQ(cache.upload_slot_count(), 1u);
    EXPECT_TRUE(cache.peek(kept, t0 + 10s).has_value());
}

TEST(ResponseCacheCapacityTest, EvictsSoonestExpiring) {
    auto& metrics = MetricsRegistry::instance();
    metrics.reset();

    // One entry per shard.
    ResponseCache cache{ResponseCache::SHARD_COUNT};
    auto t0 = ResponseCache::Clock::now();

    Preimage p1 = filled_id(0x01);
    Preimage p2 = p1;
    p2[31] = 0x02;  // same leading bytes, so the same shard

    cache.store(p1, to_bytes("first"), 10s, t0);
    cache.store(p2, to_bytes("second"), 60s, t0);

    EXPECT_FALSE(cache.peek(p1, t0).has_value());
    EXPECT_TRUE(cache.peek(p2, t0).has_value());
    EXPECT_EQ(metrics.get_counter("cache_evicted_capacity_total"), 1.0);
}
