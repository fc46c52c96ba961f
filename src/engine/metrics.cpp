#include "metrics.hpp"

namespace quiver::engine {

    MetricsCollector& MetricsCollector::global() {
        static MetricsCollector instance;
        return instance;
    }

    void MetricsCollector::record(Timer timer, std::chrono::microseconds elapsed) {
        uint64_t us = static_cast<uint64_t>(elapsed.count());
        if (timer == Timer::Embedding) {
            ++m_embed_calls;
            m_embed_us_total += us;
            return;
        }

        ++m_queries;
        m_query_us_total += us;
        uint64_t prev = m_query_us_max.load();
        while (us > prev && !m_query_us_max.compare_exchange_weak(prev, us)) {
        }
    }

    MetricsCollector::Snapshot MetricsCollector::snapshot() const {
        Snapshot s;
        s.queries = m_queries.load();
        s.degraded_queries = m_degraded_queries.load();
        s.query_us_total = m_query_us_total.load();
        s.query_us_max = m_query_us_max.load();
        s.embed_calls = m_embed_calls.load();
        s.embed_us_total = m_embed_us_total.load();
        s.remote_calls = m_remote_calls.load();
        s.cache_hits = m_cache_hits.load();
        s.cache_misses = m_cache_misses.load();
        s.degraded_writes = m_degraded_writes.load();
        s.index_rebuilds = m_index_rebuilds.load();
        return s;
    }

    double MetricsCollector::Snapshot::cache_hit_rate() const {
        uint64_t total = cache_hits + cache_misses;
        return total == 0 ? 0.0 : static_cast<double>(cache_hits) / static_cast<double>(total);
    }

    double MetricsCollector::Snapshot::mean_query_ms() const {
        return queries == 0 ? 0.0 : static_cast<double>(query_us_total) / static_cast<double>(queries) / 1000.0;
    }

    double MetricsCollector::Snapshot::mean_embed_ms() const {
        return embed_calls == 0 ? 0.0 : static_cast<double>(embed_us_total) / static_cast<double>(embed_calls) / 1000.0;
    }

}
