#include "engine/config.hpp"
#include "fake_backend.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace quiver::engine;

TEST(ConfigTest, MissingFileGivesDefaults)
{
    quiver::test_support::TempDir dir;
    auto config = Config::load(dir.path() / "absent.json");
    EXPECT_EQ(config.dimension, 768u);
    EXPECT_EQ(config.batch_size, 50u);
    EXPECT_EQ(config.fanout, 3u);
    EXPECT_FLOAT_EQ(config.vector_weight, 0.7f);
    EXPECT_FLOAT_EQ(config.keyword_weight, 0.3f);
    EXPECT_EQ(config.rerank_depth, 20u);
    EXPECT_EQ(config.storage_backend, "sqlite");
}

TEST(ConfigTest, FileOverridesOnlyListedFields)
{
    quiver::test_support::TempDir dir;
    auto path = dir.path() / "quiver.json";
    {
        std::ofstream f(path);
        f << R"({"dimension": 384, "embedding_backend": "hashing", "data_dir": "/tmp/q", "hybrid": false})";
    }
    auto config = Config::load(path);
    EXPECT_EQ(config.dimension, 384u);
    EXPECT_EQ(config.embedding_backend, "hashing");
    EXPECT_EQ(config.data_dir, std::filesystem::path("/tmp/q"));
    EXPECT_FALSE(config.hybrid);
    EXPECT_EQ(config.cache_capacity, 10000u);
}

TEST(ConfigTest, BadFilesAreConfigErrors)
{
    quiver::test_support::TempDir dir;
    auto path = dir.path() / "quiver.json";
    {
        std::ofstream f(path);
        f << "{ dimension: ";
    }
    EXPECT_THROW(Config::load(path), quiver::ConfigError);

    {
        std::ofstream f(path, std::ios::trunc);
        f << R"({"dimension": "wide"})";
    }
    EXPECT_THROW(Config::load(path), quiver::ConfigError);

    {
        std::ofstream f(path, std::ios::trunc);
        f << R"({"dimension": 0})";
    }
    EXPECT_THROW(Config::load(path), quiver::ConfigError);
}

TEST(ConfigTest, ApplyRejectsInvalidValues)
{
    Config config;
    EXPECT_THROW(config.apply(nlohmann::json::array()), quiver::ConfigError);
    EXPECT_THROW(config.apply({{"max_text_bytes", 100}, {"chunk_overlap_bytes", 200}}), quiver::ConfigError);
    EXPECT_THROW(config.apply({{"vector_weight", 0.0}, {"keyword_weight", 0.0}}), quiver::ConfigError);
    EXPECT_THROW(config.apply({{"batch_size", "many"}}), quiver::ConfigError);
}

TEST(ConfigTest, SaveRoundTripsAndOmitsEmptyKey)
{
    quiver::test_support::TempDir dir;
    auto path = dir.path() / "quiver.json";

    Config config;
    config.dimension = 256;
    config.embedding_model = "custom-model";
    config.rerank = false;
    config.save(path);

    std::ifstream f(path);
    auto j = nlohmann::json::parse(f);
    EXPECT_FALSE(j.contains("api_key"));

    auto loaded = Config::load(path);
    EXPECT_EQ(loaded.dimension, 256u);
    EXPECT_EQ(loaded.embedding_model, "custom-model");
    EXPECT_FALSE(loaded.rerank);
}
