#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "quiver/errors.hpp"

namespace quiver::engine {

    struct Config {
        // Storage
        std::filesystem::path data_dir = ".quiver_data";
        std::string storage_backend = "sqlite";
        size_t dimension = 768;

        // Embedding
        std::string embedding_backend = "openai"; // openai, ollama, hashing
        std::string embedding_endpoint = "https://integrate.api.nvidia.com/v1/embeddings";
        std::string embedding_model = "nvidia/nv-embedqa-e5-v5";
        std::string embedding_input_type = "passage"; // sent only when non-empty
        std::string api_key = "";
        long request_timeout_secs = 30;
        size_t batch_size = 50;              // max inputs per remote call
        size_t max_concurrent_requests = 4;
        size_t cache_capacity = 10000;
        long cache_ttl_secs = 3600;
        size_t max_text_bytes = 8192;        // longer texts are chunked and averaged
        size_t chunk_overlap_bytes = 512;

        // Index
        size_t hnsw_m = 16;
        size_t hnsw_ef_construction = 200;
        size_t hnsw_ef_search = 64;

        // Query
        size_t fanout = 3;
        bool hybrid = true;
        float vector_weight = 0.7f;
        float keyword_weight = 0.3f;
        bool rerank = true;
        size_t rerank_depth = 20;
        size_t snippet_chars = 200;

        /**
         * @brief Reads a config file. A missing file yields the defaults.
         * @throws ConfigError if the file exists but cannot be parsed.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            std::ifstream f(path);
            if (!f) throw ConfigError("cannot open " + path.string());

            try {
                nlohmann::json j = nlohmann::json::parse(f);
                cfg.apply(j);
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError(path.string() + ": " + e.what());
            }
            return cfg;
        }

        /**
         * @brief Overrides fields present in the JSON object.
         */
        void apply(const nlohmann::json& j) {
            if (!j.is_object()) throw ConfigError("top level must be an object");
            try {
                read_fields(j);
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError(e.what());
            }
            validate();
        }

        void read_fields(const nlohmann::json& j) {
            if (j.contains("data_dir")) data_dir = j["data_dir"].get<std::string>();
            read(j, "storage_backend", storage_backend);
            read(j, "dimension", dimension);

            read(j, "embedding_backend", embedding_backend);
            read(j, "embedding_endpoint", embedding_endpoint);
            read(j, "embedding_model", embedding_model);
            read(j, "embedding_input_type", embedding_input_type);
            read(j, "api_key", api_key);
            read(j, "request_timeout_secs", request_timeout_secs);
            read(j, "batch_size", batch_size);
            read(j, "max_concurrent_requests", max_concurrent_requests);
            read(j, "cache_capacity", cache_capacity);
            read(j, "cache_ttl_secs", cache_ttl_secs);
            read(j, "max_text_bytes", max_text_bytes);
            read(j, "chunk_overlap_bytes", chunk_overlap_bytes);

            read(j, "hnsw_m", hnsw_m);
            read(j, "hnsw_ef_construction", hnsw_ef_construction);
            read(j, "hnsw_ef_search", hnsw_ef_search);

            read(j, "fanout", fanout);
            read(j, "hybrid", hybrid);
            read(j, "vector_weight", vector_weight);
            read(j, "keyword_weight", keyword_weight);
            read(j, "rerank", rerank);
            read(j, "rerank_depth", rerank_depth);
            read(j, "snippet_chars", snippet_chars);
        }

        template <typename T>
        static void read(const nlohmann::json& j, const char* key, T& field) {
            if (j.contains(key)) field = j.at(key).get<T>();
        }

        void validate() const {
            if (dimension == 0) throw ConfigError("dimension must be positive");
            if (batch_size == 0) throw ConfigError("batch_size must be positive");
            if (max_concurrent_requests == 0) throw ConfigError("max_concurrent_requests must be positive");
            if (chunk_overlap_bytes >= max_text_bytes) throw ConfigError("chunk_overlap_bytes must be below max_text_bytes");
            if (fanout == 0) throw ConfigError("fanout must be positive");
            if (vector_weight < 0.0f || keyword_weight < 0.0f || vector_weight + keyword_weight <= 0.0f) {
                throw ConfigError("hybrid weights must be non-negative and not both zero");
            }
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["data_dir"] = data_dir.string();
            j["storage_backend"] = storage_backend;
            j["dimension"] = dimension;
            j["embedding_backend"] = embedding_backend;
            j["embedding_endpoint"] = embedding_endpoint;
            j["embedding_model"] = embedding_model;
            j["embedding_input_type"] = embedding_input_type;
            if (!api_key.empty()) j["api_key"] = api_key;
            j["request_timeout_secs"] = request_timeout_secs;
            j["batch_size"] = batch_size;
            j["max_concurrent_requests"] = max_concurrent_requests;
            j["cache_capacity"] = cache_capacity;
            j["cache_ttl_secs"] = cache_ttl_secs;
            j["max_text_bytes"] = max_text_bytes;
            j["chunk_overlap_bytes"] = chunk_overlap_bytes;
            j["hnsw_m"] = hnsw_m;
            j["hnsw_ef_construction"] = hnsw_ef_construction;
            j["hnsw_ef_search"] = hnsw_ef_search;
            j["fanout"] = fanout;
            j["hybrid"] = hybrid;
            j["vector_weight"] = vector_weight;
            j["keyword_weight"] = keyword_weight;
            j["rerank"] = rerank;
            j["rerank_depth"] = rerank_depth;
            j["snippet_chars"] = snippet_chars;

            std::ofstream f(path);
            if (!f) throw ConfigError("cannot write " + path.string());
            f << j.dump(4);
        }
    };

}
