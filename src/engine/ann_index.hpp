#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "quiver/types.hpp"
#include "config.hpp"
#include "metrics.hpp"

namespace quiver::engine {

    /**
     * @brief HNSW graph over a snapshot of the store's vectors.
     *
     * The graph is built in one batch and never patched. Writes elsewhere
     * only mark it stale; the next search rebuilds it once, however many
     * searches observed the staleness.
     */
    class AnnIndex {
    public:
        enum class State {
            Empty,  // never built
            Stale,  // built, but the record set changed since
            Built
        };

        struct Hit {
            std::string document_id;
            float distance;    // Euclidean
            float similarity;  // 1 / (1 + distance)
        };

        using SnapshotProvider = std::function<std::vector<VectorPoint>()>;

        AnnIndex(size_t dim, const Config& config, MetricsCollector& metrics = MetricsCollector::global());
        ~AnnIndex();

        /**
         * @brief Source of points for lazy rebuilds. Called with the index lock held exclusively.
         */
        void set_snapshot_provider(SnapshotProvider provider);

        /**
         * @brief Builds a new graph from points, replacing the previous one.
         * @throws DimensionMismatch if any point has the wrong length.
         */
        void insert_snapshot(const std::vector<VectorPoint>& points);

        /**
         * @brief Nearest neighbours of query_vector, nearest first, at most k.
         * Rebuilds first when the index is Empty or Stale.
         * @throws DimensionMismatch before touching any state.
         */
        std::vector<Hit> search(const std::vector<float>& query_vector, size_t k);

        void mark_stale();

        /**
         * @brief Drops the graph and returns to Empty.
         */
        void reset();

        State state() const;
        size_t size() const;
        size_t dimension() const { return m_dim; }
        uint64_t rebuild_count() const { return m_rebuilds.load(); }
        size_t memory_bytes() const;

    private:
        struct Impl;

        void build_locked(const std::vector<VectorPoint>& points);
        std::vector<Hit> search_locked(const std::vector<float>& query_vector, size_t k) const;

        std::unique_ptr<Impl> m_impl;
        size_t m_dim;
        size_t m_m;
        size_t m_ef_construction;
        size_t m_ef_search;
        MetricsCollector& m_metrics;
        SnapshotProvider m_provider;
        State m_state = State::Empty;
        std::atomic<uint64_t> m_rebuilds{0};
        mutable std::shared_mutex m_mutex;
    };

    const char* to_string(AnnIndex::State state);

}
