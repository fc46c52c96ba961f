#include "embedder.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>

namespace quiver::engine {

    /**
     * @brief Offline bag-of-words embedder (hashing trick).
     * Tokenizes text, hashes each lower-cased token into a fixed-size
     * vector, then L2-normalizes. Deterministic across runs and platforms.
     */
    class HashingBackend : public EmbeddingBackend {
    public:
        explicit HashingBackend(size_t dimension) : m_dimension(dimension) {}

        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
            std::vector<std::vector<float>> out;
            out.reserve(texts.size());
            for (const auto& text : texts) {
                out.push_back(embed_one(text));
            }
            return out;
        }

        size_t max_batch() const override { return 1024; }
        std::string name() const override { return "hashing"; }

    private:
        size_t m_dimension;

        // FNV-1a; std::hash is not stable across standard libraries.
        static uint64_t fnv1a(const std::string& token) {
            uint64_t h = 14695981039346656037ULL;
            for (unsigned char c : token) {
                h ^= c;
                h *= 1099511628211ULL;
            }
            return h;
        }

        std::vector<float> embed_one(const std::string& text) const {
            std::vector<float> vec(m_dimension, 0.0f);

            std::string token;
            auto flush = [&]() {
                if (token.empty()) return;
                vec[fnv1a(token) % m_dimension] += 1.0f;
                token.clear();
            };
            for (char c : text) {
                if (std::isalnum(static_cast<unsigned char>(c))) {
                    token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                } else {
                    flush();
                }
            }
            flush();

            float norm = 0.0f;
            for (float v : vec) {
                norm += v * v;
            }
            if (norm > 0.0f) {
                norm = std::sqrt(norm);
                for (float& v : vec) {
                    v /= norm;
                }
            }
            return vec;
        }
    };

    std::unique_ptr<EmbeddingBackend> create_hashing_backend(size_t dimension) {
        return std::make_unique<HashingBackend>(dimension);
    }

}
