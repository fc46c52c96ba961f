#pragma once

#include <string>
#include <vector>
#include "quiver/types.hpp"

namespace quiver::engine::lexical {

    /**
     * @brief Distinct query terms plus the lower-cased phrase they came from.
     */
    struct QueryTerms {
        std::vector<std::string> tokens;
        std::string phrase;

        bool empty() const { return tokens.empty(); }
    };

    std::string to_lower(const std::string& s);

    /**
     * @brief Lower-cased alphanumeric runs, in order. Bytes of multi-byte
     * UTF-8 sequences count as word characters.
     */
    std::vector<std::string> tokenize(const std::string& text);

    bool is_stop_word(const std::string& token);

    /**
     * @brief Tokenizes a query, dropping stop words and duplicates.
     */
    QueryTerms parse_query(const std::string& query_text);

    /**
     * @brief Share of query tokens found anywhere in the document, with title
     * hits counted twice. In [0,1]; 0 for an empty query.
     */
    float relevance(const QueryTerms& terms, const Document& document);

    /**
     * @brief Share of query tokens found in the given text.
     */
    float overlap(const QueryTerms& terms, const std::string& text);

    /**
     * @brief True when the whole query phrase occurs in the content or the title.
     */
    bool phrase_match(const QueryTerms& terms, const Document& document);

}
