#include "query_engine.hpp"
#include "embedder.hpp"
#include "quiver/errors.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <limits>
#include <unordered_map>

namespace quiver::engine {

    namespace {

        bool better(const Candidate& a, const Candidate& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.record.id() < b.record.id();
        }

    }

    QueryEngine::QueryEngine(DocumentStore& store, const Config& config, std::unique_ptr<Reranker> reranker,
                             MetricsCollector& metrics)
        : m_store(store),
          m_reranker(std::move(reranker)),
          m_metrics(metrics),
          m_fanout(std::max<size_t>(1, config.fanout)),
          m_hybrid(config.hybrid),
          m_vector_weight(config.vector_weight),
          m_keyword_weight(config.keyword_weight),
          m_rerank_depth(config.rerank ? config.rerank_depth : 0),
          m_snippet_chars(config.snippet_chars) {
        if (!m_reranker && config.rerank) m_reranker = create_lexical_reranker();
    }

    std::vector<SearchResult> QueryEngine::search(const std::string& query_text, size_t top_k) {
        ScopedTimer timer(m_metrics, MetricsCollector::Timer::Query);
        if (top_k == 0 || normalize_text(query_text).empty()) return {};

        auto terms = lexical::parse_query(query_text);
        std::vector<float> query_vector;
        try {
            query_vector = m_store.vectorizer().embed(query_text);
        } catch (const EmbeddingUnavailable& e) {
            std::cerr << "[QueryEngine] Embedding unavailable, answering with keyword scoring: " << e.what() << "\n";
            m_metrics.degraded_query();
            return keyword_search(query_text, terms, top_k);
        }
        return rank(query_vector, query_text, terms, top_k);
    }

    std::vector<SearchResult> QueryEngine::hybrid_search(const std::vector<float>& query_vector,
                                                         const std::string& query_text, size_t top_k) {
        ScopedTimer timer(m_metrics, MetricsCollector::Timer::Query);
        if (query_vector.size() != m_store.dimension()) {
            throw DimensionMismatch(m_store.dimension(), query_vector.size());
        }
        if (top_k == 0 || normalize_text(query_text).empty()) return {};

        return rank(query_vector, query_text, lexical::parse_query(query_text), top_k);
    }

    std::vector<SearchResult> QueryEngine::rank(const std::vector<float>& query_vector, const std::string& query_text,
                                                const lexical::QueryTerms& terms, size_t top_k) {
        if (m_store.vector_count() == 0) return {};

        size_t k = top_k > std::numeric_limits<size_t>::max() / m_fanout ? std::numeric_limits<size_t>::max()
                                                                          : top_k * m_fanout;
        auto hits = m_store.index().search(query_vector, k);
        std::unordered_map<std::string, float> similarity;
        std::vector<std::string> ids;
        ids.reserve(hits.size());
        for (const auto& hit : hits) {
            similarity[hit.document_id] = hit.similarity;
            ids.push_back(hit.document_id);
        }

        // Records removed since the last rebuild are skipped here.
        auto records = m_store.records_for(ids);
        std::vector<Candidate> candidates;
        candidates.reserve(records.size());
        for (auto& record : records) {
            Candidate c;
            float vector_score = similarity[record.id()];
            float keyword_score = m_hybrid ? lexical::relevance(terms, record.document) : 0.0f;
            if (keyword_score > 0.0f) {
                c.score = m_vector_weight * vector_score + m_keyword_weight * keyword_score;
                c.match_type = "hybrid";
            } else {
                c.score = m_hybrid ? m_vector_weight * vector_score : vector_score;
                c.match_type = "semantic";
            }
            c.record = std::move(record);
            candidates.push_back(std::move(c));
        }
        return finish(std::move(candidates), query_text, top_k);
    }

    std::vector<SearchResult> QueryEngine::keyword_search(const std::string& query_text,
                                                          const lexical::QueryTerms& terms, size_t top_k) {
        if (terms.empty()) return {};

        std::vector<Candidate> candidates;
        for (auto& record : m_store.keyword_candidates()) {
            float score = lexical::relevance(terms, record.document);
            if (score <= 0.0f) continue;
            candidates.push_back({std::move(record), score, "keyword"});
        }
        return finish(std::move(candidates), query_text, top_k);
    }

    std::vector<SearchResult> QueryEngine::finish(std::vector<Candidate> candidates, const std::string& query_text,
                                                  size_t top_k) const {
        for (auto& c : candidates) c.score = std::clamp(c.score, 0.0f, 1.0f);
        std::sort(candidates.begin(), candidates.end(), better);

        if (m_reranker && m_rerank_depth > 0 && !candidates.empty()) {
            size_t depth = std::min(m_rerank_depth, candidates.size());
            std::vector<Candidate> head(std::make_move_iterator(candidates.begin()),
                                        std::make_move_iterator(candidates.begin() + depth));
            head = m_reranker->rerank(query_text, std::move(head));
            if (head.size() != depth) {
                throw Error("reranker " + m_reranker->name() + " returned " + std::to_string(head.size()) +
                            " of " + std::to_string(depth) + " candidates");
            }

            // The head keeps the reranker's order and stays ahead of the tail,
            // whose scores are on the first-stage scale.
            float lowest = 1.0f;
            for (auto& c : head) {
                c.score = std::min(std::clamp(c.score, 0.0f, 1.0f), lowest);
                lowest = c.score;
            }
            std::move(head.begin(), head.end(), candidates.begin());
            auto tail = candidates.begin() + depth;
            if (tail != candidates.end() && tail->score > lowest) {
                float scale = lowest / tail->score;
                for (auto it = tail; it != candidates.end(); ++it) it->score = std::min(it->score * scale, lowest);
            }
        }

        if (candidates.size() > top_k) candidates.resize(top_k);

        std::vector<SearchResult> results;
        results.reserve(candidates.size());
        for (const auto& c : candidates) results.push_back(to_result(c));
        return results;
    }

    SearchResult QueryEngine::to_result(const Candidate& candidate) const {
        const Document& doc = candidate.record.document;
        SearchResult r;
        r.document_id = doc.id;
        r.title = doc.title;
        r.content_snippet = snippet(doc.content);
        r.similarity_score = candidate.score;
        r.package_name = doc.package_name;
        r.doc_type = doc.doc_type;
        r.language = doc.language;
        r.version = doc.version;
        r.metadata = doc.metadata;
        r.match_type = candidate.match_type;
        return r;
    }

    std::string QueryEngine::snippet(const std::string& content) const {
        std::string text = normalize_text(content);
        if (text.size() <= m_snippet_chars) return text;

        size_t cut = m_snippet_chars;
        // Back off to a UTF-8 lead byte.
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        return text.substr(0, cut) + "...";
    }

}
