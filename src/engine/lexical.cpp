#include "lexical.hpp"
#include "embedder.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace quiver::engine::lexical {

    namespace {

        const std::unordered_set<std::string>& stop_words() {
            static const std::unordered_set<std::string> words = {
                "a", "an", "and", "are", "as", "at", "be", "by", "for", "from",
                "how", "in", "is", "it", "of", "on", "or", "that", "the", "this",
                "to", "was", "what", "when", "where", "which", "with", "about"
            };
            return words;
        }

        bool is_word_byte(unsigned char c) {
            return std::isalnum(c) || c >= 0x80;
        }

        std::unordered_set<std::string> token_set(const std::string& text) {
            auto tokens = tokenize(text);
            return {tokens.begin(), tokens.end()};
        }

    }

    std::string to_lower(const std::string& s) {
        std::string data = s;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

    std::vector<std::string> tokenize(const std::string& text) {
        std::vector<std::string> tokens;
        std::string current;
        for (unsigned char c : text) {
            if (is_word_byte(c)) {
                current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
            } else if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) tokens.push_back(std::move(current));
        return tokens;
    }

    bool is_stop_word(const std::string& token) {
        return stop_words().count(token) > 0;
    }

    QueryTerms parse_query(const std::string& query_text) {
        QueryTerms terms;
        terms.phrase = to_lower(normalize_text(query_text));

        std::unordered_set<std::string> seen;
        for (auto& token : tokenize(query_text)) {
            if (is_stop_word(token)) continue;
            if (seen.insert(token).second) terms.tokens.push_back(std::move(token));
        }
        return terms;
    }

    float relevance(const QueryTerms& terms, const Document& document) {
        if (terms.empty()) return 0.0f;

        auto title = token_set(document.title);
        std::string body = document.content + " " + document.package_name + " " + document.doc_type;
        for (const auto& [key, value] : document.metadata) body += " " + value;
        auto rest = token_set(body);

        float score = 0.0f;
        for (const auto& token : terms.tokens) {
            if (title.count(token)) {
                score += 2.0f;
            } else if (rest.count(token)) {
                score += 1.0f;
            }
        }
        return score / (2.0f * static_cast<float>(terms.tokens.size()));
    }

    float overlap(const QueryTerms& terms, const std::string& text) {
        if (terms.empty()) return 0.0f;
        auto words = token_set(text);
        size_t found = 0;
        for (const auto& token : terms.tokens) {
            if (words.count(token)) ++found;
        }
        return static_cast<float>(found) / static_cast<float>(terms.tokens.size());
    }

    bool phrase_match(const QueryTerms& terms, const Document& document) {
        if (terms.phrase.empty()) return false;
        return to_lower(normalize_text(document.content)).find(terms.phrase) != std::string::npos ||
               to_lower(normalize_text(document.title)).find(terms.phrase) != std::string::npos;
    }

}
