#include "embedder.hpp"
#include "quiver/errors.hpp"
#include <algorithm>
#include <cctype>

namespace quiver::engine {

    namespace {
        // Moves pos back until it no longer points into the middle of a UTF-8 sequence.
        size_t utf8_boundary(const std::string& text, size_t pos) {
            while (pos > 0 && pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
                --pos;
            }
            return pos;
        }
    }

    std::vector<std::string> Chunker::split(const std::string& text, size_t chunk_size, size_t overlap) {
        std::vector<std::string> chunks;
        if (text.empty() || chunk_size == 0) return chunks;
        if (overlap >= chunk_size) overlap = 0;

        size_t start = 0;
        while (start < text.size()) {
            size_t end = std::min(start + chunk_size, text.size());
            if (end < text.size()) {
                size_t cut = utf8_boundary(text, end);
                if (cut > start) end = cut;
            }

            chunks.push_back(text.substr(start, end - start));

            if (end == text.size()) break;
            size_t next = utf8_boundary(text, end > overlap ? end - overlap : end);
            start = next > start ? next : end;
        }

        return chunks;
    }

    std::string normalize_text(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool pending_space = false;
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out += ' ';
                pending_space = false;
            }
            out += c;
        }
        return out;
    }

    void check_embeddings(const std::vector<std::vector<float>>& vectors, size_t inputs, size_t dimension) {
        if (vectors.size() != inputs) {
            throw MalformedResponse("expected " + std::to_string(inputs) + " embeddings, got " + std::to_string(vectors.size()));
        }
        for (const auto& v : vectors) {
            if (v.size() != dimension) {
                throw MalformedResponse("expected dimension " + std::to_string(dimension) + ", got " + std::to_string(v.size()));
            }
        }
    }

    std::unique_ptr<EmbeddingBackend> create_backend(const Config& config) {
        if (config.embedding_backend == "openai") return create_openai_backend(config);
        if (config.embedding_backend == "ollama") return create_ollama_backend(config);
        if (config.embedding_backend == "hashing") return create_hashing_backend(config.dimension);
        throw ConfigError("unknown embedding backend '" + config.embedding_backend + "'");
    }

}
