#pragma once

#include <memory>
#include <string>
#include <vector>
#include "quiver/types.hpp"
#include "config.hpp"
#include "document_store.hpp"
#include "lexical.hpp"
#include "metrics.hpp"
#include "reranker.hpp"

namespace quiver::engine {

    /**
     * @brief Answers similarity and hybrid queries against a DocumentStore.
     *
     * Once a query vector is in hand every step runs in memory over at most
     * top_k * fanout candidates. Results are best first, ties broken by
     * document id, scores in [0,1].
     */
    class QueryEngine {
    public:
        /**
         * @param reranker Second stage; when null and config.rerank is set, a LexicalReranker is used.
         */
        QueryEngine(DocumentStore& store, const Config& config, std::unique_ptr<Reranker> reranker = nullptr,
                    MetricsCollector& metrics = MetricsCollector::global());

        /**
         * @brief Vectorizes query_text and ranks the store against it. Falls back
         * to keyword-only scoring when the embedding backend is unavailable.
         *
         * An empty or whitespace-only query, or top_k == 0, returns no results.
         */
        std::vector<SearchResult> search(const std::string& query_text, size_t top_k);

        /**
         * @brief search() with a caller-supplied query vector.
         * @throws DimensionMismatch when query_vector has the wrong length.
         */
        std::vector<SearchResult> hybrid_search(const std::vector<float>& query_vector,
                                                const std::string& query_text, size_t top_k);

    private:
        std::vector<SearchResult> rank(const std::vector<float>& query_vector, const std::string& query_text,
                                       const lexical::QueryTerms& terms, size_t top_k);
        std::vector<SearchResult> keyword_search(const std::string& query_text,
                                                 const lexical::QueryTerms& terms, size_t top_k);
        std::vector<SearchResult> finish(std::vector<Candidate> candidates, const std::string& query_text,
                                         size_t top_k) const;
        SearchResult to_result(const Candidate& candidate) const;
        std::string snippet(const std::string& content) const;

        DocumentStore& m_store;
        std::unique_ptr<Reranker> m_reranker;
        MetricsCollector& m_metrics;
        size_t m_fanout;
        bool m_hybrid;
        float m_vector_weight;
        float m_keyword_weight;
        size_t m_rerank_depth;
        size_t m_snippet_chars;
    };

}
