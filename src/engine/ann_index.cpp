#include "ann_index.hpp"
#include "quiver/errors.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>

namespace quiver::engine {

    struct AnnIndex::Impl {
        hnswlib::L2Space space;
        std::unique_ptr<hnswlib::HierarchicalNSW<float>> alg_hnsw;
        std::vector<std::string> labels; // hnswlib label -> document id

        explicit Impl(size_t dim) : space(dim) {}
    };

    AnnIndex::AnnIndex(size_t dim, const Config& config, MetricsCollector& metrics)
        : m_impl(std::make_unique<Impl>(dim)),
          m_dim(dim),
          m_m(config.hnsw_m),
          m_ef_construction(config.hnsw_ef_construction),
          m_ef_search(config.hnsw_ef_search),
          m_metrics(metrics) {}

    AnnIndex::~AnnIndex() = default;

    void AnnIndex::set_snapshot_provider(SnapshotProvider provider) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_provider = std::move(provider);
    }

    void AnnIndex::insert_snapshot(const std::vector<VectorPoint>& points) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        build_locked(points);
    }

    void AnnIndex::build_locked(const std::vector<VectorPoint>& points) {
        for (const auto& p : points) {
            if (p.vector.size() != m_dim) throw DimensionMismatch(m_dim, p.vector.size());
        }

        std::unique_ptr<hnswlib::HierarchicalNSW<float>> graph;
        std::vector<std::string> labels;
        if (!points.empty()) {
            try {
                graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(&m_impl->space, points.size(), m_m, m_ef_construction);
                graph->setEf(m_ef_search);
                labels.reserve(points.size());
                for (size_t i = 0; i < points.size(); ++i) {
                    graph->addPoint(points[i].vector.data(), i);
                    labels.push_back(points[i].document_id);
                }
            } catch (const std::exception& e) {
                std::cerr << "[AnnIndex] Build error: " << e.what() << "\n";
                throw Error(std::string("index build failed: ") + e.what());
            }
        }

        m_impl->alg_hnsw = std::move(graph);
        m_impl->labels = std::move(labels);
        m_state = State::Built;
        ++m_rebuilds;
        m_metrics.index_rebuild();
    }

    std::vector<AnnIndex::Hit> AnnIndex::search(const std::vector<float>& query_vector, size_t k) {
        if (query_vector.size() != m_dim) throw DimensionMismatch(m_dim, query_vector.size());
        if (k == 0) return {};

        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            if (m_state == State::Built) return search_locked(query_vector, k);
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        // Another searcher may have rebuilt while we waited for the lock.
        if (m_state != State::Built) {
            build_locked(m_provider ? m_provider() : std::vector<VectorPoint>{});
        }
        // Answer from this graph before a writer can mark it stale again.
        return search_locked(query_vector, k);
    }

    std::vector<AnnIndex::Hit> AnnIndex::search_locked(const std::vector<float>& query_vector, size_t k) const {
        std::vector<Hit> results;
        if (!m_impl->alg_hnsw) return results;

        // searchKnn returns a max-heap on distance: furthest on top.
        auto pq = m_impl->alg_hnsw->searchKnn(query_vector.data(), std::min(k, m_impl->labels.size()));
        results.reserve(pq.size());
        while (!pq.empty()) {
            const auto& [squared, label] = pq.top();
            float distance = std::sqrt(std::max(0.0f, squared));
            results.push_back({m_impl->labels[label], distance, 1.0f / (1.0f + distance)});
            pq.pop();
        }
        std::reverse(results.begin(), results.end());
        return results;
    }

    void AnnIndex::mark_stale() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_state == State::Built) m_state = State::Stale;
    }

    void AnnIndex::reset() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_impl->alg_hnsw.reset();
        m_impl->labels.clear();
        m_state = State::Empty;
    }

    AnnIndex::State AnnIndex::state() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_state;
    }

    size_t AnnIndex::size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_impl->labels.size();
    }

    size_t AnnIndex::memory_bytes() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        size_t per_point = m_dim * sizeof(float) + 2 * m_m * sizeof(hnswlib::tableint) + sizeof(hnswlib::labeltype);
        size_t bytes = m_impl->labels.size() * per_point;
        for (const auto& id : m_impl->labels) bytes += id.size() + sizeof(std::string);
        return bytes;
    }

    const char* to_string(AnnIndex::State state) {
        switch (state) {
            case AnnIndex::State::Empty: return "empty";
            case AnnIndex::State::Stale: return "stale";
            case AnnIndex::State::Built: return "built";
        }
        return "unknown";
    }

}
