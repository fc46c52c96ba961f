#include "engine/vectorizer.hpp"
#include "fake_backend.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace quiver::engine;
using quiver::test_support::FakeBackend;

namespace {

    Config small_config(size_t batch_size = 50)
    {
        Config config;
        config.dimension = 16;
        config.batch_size = batch_size;
        config.max_concurrent_requests = 4;
        return config;
    }

    template <typename F>
    std::chrono::microseconds time_it(F&& f)
    {
        auto start = std::chrono::steady_clock::now();
        f();
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    }

}

TEST(VectorizerTest, RepeatedTextHitsCache)
{
    auto backend = std::make_shared<FakeBackend>(16, std::chrono::milliseconds(50));
    MetricsCollector metrics;
    Vectorizer vectorizer(backend, small_config(), metrics);

    std::vector<float> first, second;
    auto cold = time_it([&] { first = vectorizer.embed("asynchronous scripting"); });
    auto warm = time_it([&] { second = vectorizer.embed("asynchronous scripting"); });

    EXPECT_EQ(backend->calls(), 1u);
    EXPECT_EQ(first, second);
    EXPECT_LT(warm.count() * 10, cold.count());

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.cache_hits, 1u);
    EXPECT_EQ(snap.cache_misses, 1u);
    EXPECT_EQ(snap.remote_calls, 1u);
}

TEST(VectorizerTest, WhitespaceVariantsShareCacheEntry)
{
    auto backend = std::make_shared<FakeBackend>(16);
    Vectorizer vectorizer(backend, small_config());

    vectorizer.embed("hello   world");
    vectorizer.embed("  hello world\n");
    EXPECT_EQ(backend->calls(), 1u);
    EXPECT_EQ(Vectorizer::cache_key("hello   world"), Vectorizer::cache_key("hello world"));
}

TEST(VectorizerTest, BatchIsFasterThanSequentialCalls)
{
    std::vector<std::string> texts;
    for (int i = 0; i < 8; ++i) texts.push_back("document number " + std::to_string(i));

    auto seq_backend = std::make_shared<FakeBackend>(16, std::chrono::milliseconds(30));
    Vectorizer sequential(seq_backend, small_config());
    auto seq_time = time_it([&] {
        for (const auto& t : texts) sequential.embed(t);
    });

    auto batch_backend = std::make_shared<FakeBackend>(16, std::chrono::milliseconds(30));
    Vectorizer batched(batch_backend, small_config());
    std::vector<std::vector<float>> vectors;
    auto batch_time = time_it([&] { vectors = batched.embed_batch(texts); });

    EXPECT_EQ(seq_backend->calls(), texts.size());
    EXPECT_EQ(batch_backend->calls(), 1u);
    EXPECT_LT(batch_time.count(), seq_time.count() * 0.8);
    ASSERT_EQ(vectors.size(), texts.size());
}

TEST(VectorizerTest, BatchPreservesOrderAndDeduplicates)
{
    auto backend = std::make_shared<FakeBackend>(16);
    Vectorizer vectorizer(backend, small_config());

    auto single_a = create_hashing_backend(16)->embed_batch({"alpha"}).front();
    auto vectors = vectorizer.embed_batch({"alpha", "beta", "alpha", " alpha "});

    ASSERT_EQ(vectors.size(), 4u);
    EXPECT_EQ(vectors[0], single_a);
    EXPECT_EQ(vectors[2], single_a);
    EXPECT_EQ(vectors[3], single_a);
    EXPECT_NE(vectors[1], single_a);
    EXPECT_EQ(backend->inputs(), 2u);
}

TEST(VectorizerTest, MissesAreCoalescedIntoBatchSizedCalls)
{
    auto backend = std::make_shared<FakeBackend>(16, std::chrono::milliseconds(0), 64);
    Vectorizer vectorizer(backend, small_config(4));

    std::vector<std::string> texts;
    for (int i = 0; i < 10; ++i) texts.push_back("text " + std::to_string(i));
    auto vectors = vectorizer.embed_batch(texts);

    ASSERT_EQ(vectors.size(), 10u);
    auto sizes = backend->batch_sizes();
    std::sort(sizes.begin(), sizes.end());
    EXPECT_EQ(sizes, (std::vector<size_t>{2, 4, 4}));

    // Order survives the concurrent round-trips.
    auto expected = create_hashing_backend(16)->embed_batch(texts);
    EXPECT_EQ(vectors, expected);
}

TEST(VectorizerTest, BackendBatchLimitCapsChunkSize)
{
    auto backend = std::make_shared<FakeBackend>(16, std::chrono::milliseconds(0), 3);
    Vectorizer vectorizer(backend, small_config(50));

    vectorizer.embed_batch({"a1", "a2", "a3", "a4", "a5"});
    for (size_t n : backend->batch_sizes()) EXPECT_LE(n, 3u);
    EXPECT_EQ(backend->calls(), 2u);
}

TEST(VectorizerTest, FailuresSurfaceAsEmbeddingUnavailableAndAreNotCached)
{
    auto backend = std::make_shared<FakeBackend>(16);
    Vectorizer vectorizer(backend, small_config());

    backend->fail_with(FakeBackend::Failure::Network);
    EXPECT_THROW(vectorizer.embed("query"), quiver::EmbeddingUnavailable);
    backend->fail_with(FakeBackend::Failure::Auth);
    EXPECT_THROW(vectorizer.embed("query"), quiver::AuthFailure);
    backend->fail_with(FakeBackend::Failure::RateLimit);
    EXPECT_THROW(vectorizer.embed("query"), quiver::RateLimited);
    EXPECT_EQ(vectorizer.cache_size(), 0u);

    backend->fail_with(FakeBackend::Failure::None);
    EXPECT_EQ(vectorizer.embed("query").size(), 16u);
    EXPECT_EQ(vectorizer.cache_size(), 1u);
}

TEST(VectorizerTest, WrongDimensionIsMalformedResponse)
{
    auto backend = std::make_shared<FakeBackend>(16);
    Vectorizer vectorizer(backend, small_config());

    backend->fail_with(FakeBackend::Failure::Malformed);
    EXPECT_THROW(vectorizer.embed("query"), quiver::MalformedResponse);
}

TEST(VectorizerTest, FailingChunkFailsWholeBatch)
{
    auto backend = std::make_shared<FakeBackend>(16, std::chrono::milliseconds(5), 64);
    Vectorizer vectorizer(backend, small_config(2));

    backend->fail_with(FakeBackend::Failure::Network);
    std::vector<std::string> texts = {"t1", "t2", "t3", "t4", "t5", "t6"};
    EXPECT_THROW(vectorizer.embed_batch(texts), quiver::NetworkError);
    EXPECT_EQ(vectorizer.cache_size(), 0u);
}

TEST(VectorizerTest, WarmupAndClearCache)
{
    auto backend = std::make_shared<FakeBackend>(16);
    Vectorizer vectorizer(backend, small_config());

    vectorizer.warmup({"one", "two", "three"});
    EXPECT_EQ(vectorizer.cache_size(), 3u);
    size_t calls = backend->calls();

    vectorizer.embed("two");
    EXPECT_EQ(backend->calls(), calls);

    vectorizer.clear_cache();
    EXPECT_EQ(vectorizer.cache_size(), 0u);
    vectorizer.embed("two");
    EXPECT_EQ(backend->calls(), calls + 1);
}
