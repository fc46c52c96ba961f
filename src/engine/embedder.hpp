#pragma once

#include <string>
#include <vector>
#include <memory>
#include "config.hpp"

namespace quiver::engine {

    /**
     * @brief Abstract embedding backend. One call maps a list of inputs to
     * one vector per input, in order.
     *
     * Implementations throw AuthFailure, RateLimited, NetworkError or
     * MalformedResponse; they never return a short or ragged result.
     */
    class EmbeddingBackend {
    public:
        virtual ~EmbeddingBackend() = default;

        /**
         * @brief Embeds every input with a single remote round-trip.
         * @param texts Inputs, at most max_batch() of them.
         */
        virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;

        /**
         * @brief Largest input list a single call accepts.
         */
        virtual size_t max_batch() const = 0;

        virtual std::string name() const = 0;
    };

    class Chunker {
    public:
        /**
         * @brief Splits text into byte windows of at most chunk_size with the given overlap.
         * Window edges never split a UTF-8 sequence.
         */
        static std::vector<std::string> split(const std::string& text, size_t chunk_size, size_t overlap);
    };

    /**
     * @brief Whitespace-trimmed text with internal whitespace runs collapsed to one space.
     */
    std::string normalize_text(const std::string& text);

    /**
     * @brief Checks a backend response: one vector per input, each of the expected dimension.
     * @throws MalformedResponse
     */
    void check_embeddings(const std::vector<std::vector<float>>& vectors, size_t inputs, size_t dimension);

    std::unique_ptr<EmbeddingBackend> create_openai_backend(const Config& config);
    std::unique_ptr<EmbeddingBackend> create_ollama_backend(const Config& config);
    std::unique_ptr<EmbeddingBackend> create_hashing_backend(size_t dimension);

    /**
     * @brief Picks the backend named by config.embedding_backend.
     * @throws ConfigError for an unknown name.
     */
    std::unique_ptr<EmbeddingBackend> create_backend(const Config& config);

}
