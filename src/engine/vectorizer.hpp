#pragma once

#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedder.hpp"
#include "embedding_cache.hpp"
#include "metrics.hpp"

namespace quiver::engine {

    /**
     * @brief Cache-aware front of an EmbeddingBackend.
     *
     * Every backend failure leaves this class as EmbeddingUnavailable (or a
     * subclass). No lock is held while the backend runs.
     */
    class Vectorizer {
    public:
        Vectorizer(std::shared_ptr<EmbeddingBackend> backend, const Config& config,
                   MetricsCollector& metrics = MetricsCollector::global());

        /**
         * @brief Embeds one text; a cache hit issues no remote call.
         */
        std::vector<float> embed(const std::string& text);

        /**
         * @brief Embeds texts in input order. Cache misses are deduplicated and
         * coalesced into as few backend calls as its batch limit allows.
         */
        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);

        /**
         * @brief Pre-populates the cache.
         */
        void warmup(const std::vector<std::string>& texts);

        void clear_cache();
        size_t cache_size() const;
        size_t cache_memory_bytes() const;
        size_t dimension() const { return m_dimension; }
        std::string backend_name() const { return m_backend->name(); }

        /**
         * @brief SHA-256 of the normalized text.
         */
        static std::string cache_key(const std::string& text);

    private:
        std::vector<std::vector<float>> call_backend(const std::vector<std::string>& texts);

        std::shared_ptr<EmbeddingBackend> m_backend;
        EmbeddingCache m_cache;
        MetricsCollector& m_metrics;
        size_t m_dimension;
        size_t m_batch_size;
        size_t m_max_concurrent;
    };

}
