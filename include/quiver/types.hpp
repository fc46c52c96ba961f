#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace quiver {

    using Clock = std::chrono::system_clock;
    using Metadata = std::map<std::string, std::string>;

    /**
     * @brief A caller-supplied document. An empty id is replaced by a generated one on add.
     */
    struct Document {
        std::string id;
        std::string title;
        std::string content;
        std::string package_name;
        std::string doc_type;
        std::string language;
        std::string version;
        Metadata metadata;
    };

    /**
     * @brief A stored document. An empty embedding marks a degraded entry.
     */
    struct DocumentRecord {
        Document document;
        std::vector<float> embedding;
        Clock::time_point created_at;
        Clock::time_point updated_at;

        const std::string& id() const { return document.id; }
        bool has_embedding() const { return !embedding.empty(); }
    };

    struct VectorPoint {
        std::vector<float> vector;
        std::string document_id;
    };

    struct SearchResult {
        std::string document_id;
        std::string title;
        std::string content_snippet;
        float similarity_score = 0.0f;
        std::string package_name;
        std::string doc_type;
        std::string language;
        std::string version;
        Metadata metadata;
        std::string match_type; // semantic, hybrid or keyword
    };

    struct DatabaseStats {
        size_t document_count = 0;
        size_t vector_count = 0;
        double total_size_mb = 0.0;
        double memory_usage_mb = 0.0;
        double index_size_mb = 0.0;
        Clock::time_point last_updated{};

        uint64_t cache_hits = 0;
        uint64_t cache_misses = 0;
        size_t cache_entries = 0;
        uint64_t queries = 0;
        uint64_t degraded_queries = 0;
        uint64_t degraded_writes = 0;
        uint64_t index_rebuilds = 0;
        double mean_query_ms = 0.0;
    };

}
