#include "engine/ann_index.hpp"
#include "quiver/errors.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace quiver::engine;
using quiver::VectorPoint;

class AnnIndexTest : public ::testing::Test
{
protected:
    AnnIndexTest() : index_(4, config_, metrics_) {}

    static std::vector<VectorPoint> square_points()
    {
        return {
            {{0, 0, 0, 0}, "origin"},
            {{3, 4, 0, 0}, "far"},
            {{1, 0, 0, 0}, "near"},
        };
    }

    Config config_;
    MetricsCollector metrics_;
    AnnIndex index_;
};

TEST_F(AnnIndexTest, StartsEmptyAndBuildsOnFirstSearch)
{
    EXPECT_EQ(index_.state(), AnnIndex::State::Empty);
    EXPECT_TRUE(index_.search({0, 0, 0, 0}, 5).empty());
    EXPECT_EQ(index_.state(), AnnIndex::State::Built);
    EXPECT_EQ(index_.rebuild_count(), 1u);
}

TEST_F(AnnIndexTest, NearestFirstWithEuclideanSimilarity)
{
    index_.insert_snapshot(square_points());
    auto hits = index_.search({0, 0, 0, 0}, 3);

    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].document_id, "origin");
    EXPECT_EQ(hits[1].document_id, "near");
    EXPECT_EQ(hits[2].document_id, "far");

    EXPECT_FLOAT_EQ(hits[0].distance, 0.0f);
    EXPECT_FLOAT_EQ(hits[0].similarity, 1.0f);
    EXPECT_FLOAT_EQ(hits[2].distance, 5.0f);
    EXPECT_FLOAT_EQ(hits[2].similarity, 1.0f / 6.0f);
}

TEST_F(AnnIndexTest, ReturnsAtMostK)
{
    index_.insert_snapshot(square_points());
    EXPECT_EQ(index_.search({1, 1, 0, 0}, 2).size(), 2u);
    EXPECT_EQ(index_.search({1, 1, 0, 0}, 10).size(), 3u);
    EXPECT_TRUE(index_.search({1, 1, 0, 0}, 0).empty());
}

TEST_F(AnnIndexTest, WrongQueryLengthTouchesNothing)
{
    bool provider_called = false;
    index_.set_snapshot_provider([&]() {
        provider_called = true;
        return square_points();
    });

    try {
        index_.search({1, 2, 3}, 3);
        FAIL() << "expected DimensionMismatch";
    } catch (const quiver::DimensionMismatch& e) {
        EXPECT_EQ(e.expected(), 4u);
        EXPECT_EQ(e.actual(), 3u);
    }
    EXPECT_FALSE(provider_called);
    EXPECT_EQ(index_.state(), AnnIndex::State::Empty);
    EXPECT_EQ(index_.rebuild_count(), 0u);
}

TEST_F(AnnIndexTest, BadSnapshotKeepsPreviousGraph)
{
    index_.insert_snapshot(square_points());
    EXPECT_THROW(index_.insert_snapshot({{{1, 2}, "short"}}), quiver::DimensionMismatch);
    EXPECT_EQ(index_.size(), 3u);
    EXPECT_EQ(index_.state(), AnnIndex::State::Built);
}

TEST_F(AnnIndexTest, StaleIndexRebuildsFromProvider)
{
    std::vector<VectorPoint> points = square_points();
    index_.set_snapshot_provider([&]() { return points; });

    index_.search({0, 0, 0, 0}, 1);
    EXPECT_EQ(index_.size(), 3u);

    points.push_back({{0, 0, 0, 0.5f}, "added"});
    index_.mark_stale();
    EXPECT_EQ(index_.state(), AnnIndex::State::Stale);

    auto hits = index_.search({0, 0, 0, 0.5f}, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].document_id, "added");
    EXPECT_EQ(index_.rebuild_count(), 2u);
    EXPECT_EQ(metrics_.snapshot().index_rebuilds, 2u);
}

TEST_F(AnnIndexTest, SearchRebuildsAtMostOnceUnderConstantWrites)
{
    index_.set_snapshot_provider([]() { return square_points(); });
    index_.search({0, 0, 0, 0}, 1);

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        while (!done) index_.mark_stale();
    });

    const int searches = 200;
    uint64_t before = index_.rebuild_count();
    for (int i = 0; i < searches; ++i) {
        auto hits = index_.search({0, 0, 0, 0}, 1);
        ASSERT_EQ(hits.size(), 1u);
        EXPECT_EQ(hits[0].document_id, "origin");
    }
    done = true;
    writer.join();

    EXPECT_LE(index_.rebuild_count() - before, static_cast<uint64_t>(searches));
}

TEST_F(AnnIndexTest, MarkStaleOnEmptyStaysEmpty)
{
    index_.mark_stale();
    EXPECT_EQ(index_.state(), AnnIndex::State::Empty);
}

TEST_F(AnnIndexTest, ResetReturnsToEmpty)
{
    index_.insert_snapshot(square_points());
    index_.reset();
    EXPECT_EQ(index_.state(), AnnIndex::State::Empty);
    EXPECT_EQ(index_.size(), 0u);
    EXPECT_EQ(index_.memory_bytes(), 0u);
}

TEST_F(AnnIndexTest, ConcurrentSearchesOnStaleIndexRebuildOnce)
{
    std::atomic<int> provider_calls{0};
    index_.set_snapshot_provider([&]() {
        ++provider_calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return square_points();
    });
    index_.search({0, 0, 0, 0}, 1);
    index_.mark_stale();
    provider_calls = 0;
    uint64_t before = index_.rebuild_count();

    std::atomic<bool> go{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&]() {
            while (!go) std::this_thread::yield();
            for (int i = 0; i < 20; ++i) {
                if (index_.search({0, 0, 0, 0}, 2).size() != 2) ++failures;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(provider_calls.load(), 1);
    EXPECT_EQ(index_.rebuild_count(), before + 1);
}

TEST(AnnIndexStateTest, Names)
{
    EXPECT_STREQ(to_string(AnnIndex::State::Empty), "empty");
    EXPECT_STREQ(to_string(AnnIndex::State::Stale), "stale");
    EXPECT_STREQ(to_string(AnnIndex::State::Built), "built");
}
