#pragma once

#include <memory>
#include <string>
#include <vector>
#include "quiver/types.hpp"

namespace quiver::engine {

    /**
     * @brief A record on its way through the query pipeline.
     */
    struct Candidate {
        DocumentRecord record;
        float score = 0.0f;       // in [0,1]
        std::string match_type;   // semantic, hybrid or keyword
    };

    /**
     * @brief Second-stage re-scoring of a short candidate list.
     *
     * Returns the same candidates, best first, with new scores in [0,1].
     * Implementations do no I/O and touch no store state.
     */
    class Reranker {
    public:
        virtual ~Reranker() = default;
        virtual std::vector<Candidate> rerank(const std::string& query_text, std::vector<Candidate> candidates) const = 0;
        virtual std::string name() const = 0;
    };

    /**
     * @brief Blends the incoming score with token overlap, exact phrase and
     * title signals: 0.6 * prior + 0.4 * relevance. Ties keep their input order.
     */
    class LexicalReranker : public Reranker {
    public:
        std::vector<Candidate> rerank(const std::string& query_text, std::vector<Candidate> candidates) const override;
        std::string name() const override { return "lexical"; }
    };

    std::unique_ptr<Reranker> create_lexical_reranker();

}
