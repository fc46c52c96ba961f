#include "engine/embedding_cache.hpp"
#include <gtest/gtest.h>
#include <thread>

using quiver::engine::EmbeddingCache;

TEST(EmbeddingCacheTest, MissThenHit)
{
    EmbeddingCache cache(10, std::chrono::seconds(60));
    EXPECT_FALSE(cache.get("k").has_value());

    cache.put("k", {1.0f, 2.0f});
    auto hit = cache.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, (std::vector<float>{1.0f, 2.0f}));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(EmbeddingCacheTest, ExpiredEntriesAreMisses)
{
    EmbeddingCache cache(10, std::chrono::seconds(1));
    cache.put("k", {1.0f});
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_FALSE(cache.get("k").has_value());
}

TEST(EmbeddingCacheTest, EvictsLeastRecentlyUsedWhenFull)
{
    EmbeddingCache cache(3, std::chrono::seconds(0));
    cache.put("a", {1.0f});
    cache.put("b", {2.0f});
    cache.put("c", {3.0f});
    ASSERT_TRUE(cache.get("a").has_value()); // b is now the oldest

    cache.put("d", {4.0f});
    EXPECT_LE(cache.size(), 3u);
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("a").has_value());
    EXPECT_TRUE(cache.get("d").has_value());
}

TEST(EmbeddingCacheTest, ZeroCapacityStoresNothing)
{
    EmbeddingCache cache(0, std::chrono::seconds(60));
    cache.put("k", {1.0f});
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EmbeddingCacheTest, ClearAndMemory)
{
    EmbeddingCache cache(10, std::chrono::seconds(60));
    cache.put("k", std::vector<float>(128, 0.5f));
    EXPECT_GE(cache.memory_bytes(), 128 * sizeof(float));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.memory_bytes(), 0u);
}
