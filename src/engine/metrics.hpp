#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace quiver::engine {

    /**
     * @brief Process-wide, append-only counters for queries, embeddings and the cache.
     */
    class MetricsCollector {
    public:
        enum class Timer {
            Query,
            Embedding
        };

        struct Snapshot {
            uint64_t queries = 0;
            uint64_t degraded_queries = 0;
            uint64_t query_us_total = 0;
            uint64_t query_us_max = 0;
            uint64_t embed_calls = 0;
            uint64_t embed_us_total = 0;
            uint64_t remote_calls = 0;
            uint64_t cache_hits = 0;
            uint64_t cache_misses = 0;
            uint64_t degraded_writes = 0;
            uint64_t index_rebuilds = 0;

            double cache_hit_rate() const;
            double mean_query_ms() const;
            double mean_embed_ms() const;
        };

        static MetricsCollector& global();

        void record(Timer timer, std::chrono::microseconds elapsed);
        void cache_hit(uint64_t n = 1) { m_cache_hits += n; }
        void cache_miss(uint64_t n = 1) { m_cache_misses += n; }
        void remote_call() { ++m_remote_calls; }
        void degraded_query() { ++m_degraded_queries; }
        void degraded_write(uint64_t n = 1) { m_degraded_writes += n; }
        void index_rebuild() { ++m_index_rebuilds; }

        Snapshot snapshot() const;

    private:
        std::atomic<uint64_t> m_queries{0};
        std::atomic<uint64_t> m_degraded_queries{0};
        std::atomic<uint64_t> m_query_us_total{0};
        std::atomic<uint64_t> m_query_us_max{0};
        std::atomic<uint64_t> m_embed_calls{0};
        std::atomic<uint64_t> m_embed_us_total{0};
        std::atomic<uint64_t> m_remote_calls{0};
        std::atomic<uint64_t> m_cache_hits{0};
        std::atomic<uint64_t> m_cache_misses{0};
        std::atomic<uint64_t> m_degraded_writes{0};
        std::atomic<uint64_t> m_index_rebuilds{0};
    };

    /**
     * @brief Records the elapsed time of its scope on destruction, including during unwinding.
     */
    class ScopedTimer {
    public:
        ScopedTimer(MetricsCollector& metrics, MetricsCollector::Timer timer)
            : m_metrics(metrics), m_timer(timer), m_start(std::chrono::steady_clock::now()) {}

        ~ScopedTimer() {
            m_metrics.record(m_timer, std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - m_start));
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        MetricsCollector& m_metrics;
        MetricsCollector::Timer m_timer;
        std::chrono::steady_clock::time_point m_start;
    };

}
