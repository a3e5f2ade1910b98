#include <gtest/gtest.h>

#include "adapters/secondary/HealthProbes.hpp"
#include "adapters/secondary/InMemorySharedCache.hpp"
#include "mocks/FakeClock.hpp"

#include <algorithm>

using namespace apiclient;
using namespace apiclient::adapters::secondary;
using namespace std::chrono_literals;

class InMemorySharedCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<tests::FakeClock>();
        cache_ = std::make_shared<InMemorySharedCache>(clock_);
    }

    std::shared_ptr<tests::FakeClock> clock_;
    std::shared_ptr<InMemorySharedCache> cache_;
};

// ============================================================================
// SETEX / GET / TTL
// ============================================================================

TEST_F(InMemorySharedCacheTest, Setex_ThenGet) {
    EXPECT_TRUE(cache_->setex("k", 10, "v"));

    EXPECT_EQ(*cache_->get("k"), "v");
    EXPECT_EQ(*cache_->ttl("k"), 10);
}

TEST_F(InMemorySharedCacheTest, NonPositiveTtl_Rejected) {
    EXPECT_FALSE(cache_->setex("k", 0, "v"));
    EXPECT_FALSE(cache_->setex("k", -5, "v"));
    EXPECT_FALSE(cache_->get("k").has_value());
}

TEST_F(InMemorySharedCacheTest, Ttl_RoundsUp) {
    cache_->setex("k", 10, "v");

    clock_->advance(2500ms);

    EXPECT_EQ(*cache_->ttl("k"), 8);
}

TEST_F(InMemorySharedCacheTest, Expired_GoneEverywhere) {
    cache_->setex("k", 10, "v");

    clock_->advance(10s);

    EXPECT_FALSE(cache_->get("k").has_value());
    EXPECT_FALSE(cache_->ttl("k").has_value());
    EXPECT_FALSE(cache_->remove("k"));
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(InMemorySharedCacheTest, Setex_OverwritesValueAndTtl) {
    cache_->setex("k", 10, "old");
    clock_->advance(5s);

    cache_->setex("k", 100, "new");

    EXPECT_EQ(*cache_->get("k"), "new");
    EXPECT_EQ(*cache_->ttl("k"), 100);
}

TEST_F(InMemorySharedCacheTest, Remove_ReportsWhetherKeyExisted) {
    cache_->setex("k", 10, "v");

    EXPECT_TRUE(cache_->remove("k"));
    EXPECT_FALSE(cache_->remove("k"));
}

// ============================================================================
// KEYS
// ============================================================================

TEST_F(InMemorySharedCacheTest, Keys_PrefixPattern) {
    cache_->setex("orders:GET:", 10, "a");
    cache_->setex("orders/42:GET:", 10, "b");
    cache_->setex("users:GET:", 10, "c");

    auto keys = cache_->keys("orders*");
    std::sort(keys.begin(), keys.end());

    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "orders/42:GET:");
    EXPECT_EQ(keys[1], "orders:GET:");
}

TEST_F(InMemorySharedCacheTest, Keys_SkipsExpired) {
    cache_->setex("short", 1, "a");
    cache_->setex("long", 60, "b");

    clock_->advance(2s);

    auto keys = cache_->keys("*");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "long");
}

TEST_F(InMemorySharedCacheTest, GlobMatch_Wildcards) {
    EXPECT_TRUE(InMemorySharedCache::globMatch("*", ""));
    EXPECT_TRUE(InMemorySharedCache::globMatch("a*c", "abbbc"));
    EXPECT_TRUE(InMemorySharedCache::globMatch("a?c", "abc"));
    EXPECT_TRUE(InMemorySharedCache::globMatch("*:GET:*", "orders:GET:page=1"));
    EXPECT_FALSE(InMemorySharedCache::globMatch("a?c", "ac"));
    EXPECT_FALSE(InMemorySharedCache::globMatch("orders*", "users:orders"));
    EXPECT_FALSE(InMemorySharedCache::globMatch("abc", "abcd"));
}

// ============================================================================
// SharedCacheHealthProbe
// ============================================================================

TEST_F(InMemorySharedCacheTest, HealthProbe_WritesAndReadsProbeKey) {
    SharedCacheHealthProbe probe(cache_);

    EXPECT_EQ(probe.name(), "cache");
    EXPECT_TRUE(probe.probe());
    EXPECT_EQ(*cache_->get(SharedCacheHealthProbe::PROBE_KEY), "ok");
}
