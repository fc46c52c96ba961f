#include "reranker.hpp"
#include "lexical.hpp"
#include <algorithm>

namespace quiver::engine {

    namespace {
        constexpr float kPriorWeight = 0.6f;
        constexpr float kRelevanceWeight = 0.4f;

        // Relevance mix; sums to 1.
        constexpr float kOverlapWeight = 0.5f;
        constexpr float kPhraseWeight = 0.3f;
        constexpr float kTitleWeight = 0.2f;
    }

    std::vector<Candidate> LexicalReranker::rerank(const std::string& query_text, std::vector<Candidate> candidates) const {
        auto terms = lexical::parse_query(query_text);
        if (terms.empty()) return candidates;

        for (auto& c : candidates) {
            const Document& doc = c.record.document;
            float relevance = kOverlapWeight * lexical::overlap(terms, doc.content + " " + doc.title) +
                              kPhraseWeight * (lexical::phrase_match(terms, doc) ? 1.0f : 0.0f) +
                              kTitleWeight * lexical::overlap(terms, doc.title);
            float prior = std::clamp(c.score, 0.0f, 1.0f);
            c.score = std::clamp(kPriorWeight * prior + kRelevanceWeight * relevance, 0.0f, 1.0f);
        }

        std::stable_sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
        return candidates;
    }

    std::unique_ptr<Reranker> create_lexical_reranker() {
        return std::make_unique<LexicalReranker>();
    }

}
