#include "vectorizer.hpp"
#include "quiver/errors.hpp"
#include "quiver/sha256.h"
#include <algorithm>
#include <exception>
#include <future>
#include <unordered_map>

namespace quiver::engine {

    Vectorizer::Vectorizer(std::shared_ptr<EmbeddingBackend> backend, const Config& config, MetricsCollector& metrics)
        : m_backend(std::move(backend)),
          m_cache(config.cache_capacity, std::chrono::seconds(config.cache_ttl_secs)),
          m_metrics(metrics),
          m_dimension(config.dimension),
          m_batch_size(config.batch_size),
          m_max_concurrent(config.max_concurrent_requests) {
        if (!m_backend) throw ConfigError("vectorizer needs an embedding backend");
        m_batch_size = std::max<size_t>(1, std::min(m_batch_size, m_backend->max_batch()));
    }

    std::string Vectorizer::cache_key(const std::string& text) {
        return crypto::SHA256::hash(normalize_text(text));
    }

    std::vector<float> Vectorizer::embed(const std::string& text) {
        auto result = embed_batch({text});
        return std::move(result.front());
    }

    std::vector<std::vector<float>> Vectorizer::embed_batch(const std::vector<std::string>& texts) {
        ScopedTimer timer(m_metrics, MetricsCollector::Timer::Embedding);

        std::vector<std::vector<float>> results(texts.size());
        std::vector<std::string> miss_keys;
        std::vector<std::string> miss_texts;
        std::unordered_map<std::string, std::vector<size_t>> waiting;

        uint64_t hits = 0;
        for (size_t i = 0; i < texts.size(); ++i) {
            std::string key = cache_key(texts[i]);
            if (auto cached = m_cache.get(key)) {
                results[i] = std::move(*cached);
                ++hits;
                continue;
            }
            auto& slots = waiting[key];
            if (slots.empty()) {
                miss_keys.push_back(key);
                miss_texts.push_back(normalize_text(texts[i]));
            }
            slots.push_back(i);
        }
        if (hits > 0) m_metrics.cache_hit(hits);
        if (miss_texts.empty()) return results;
        m_metrics.cache_miss(miss_texts.size());

        auto vectors = call_backend(miss_texts);
        check_embeddings(vectors, miss_texts.size(), m_dimension);

        for (size_t m = 0; m < miss_keys.size(); ++m) {
            for (size_t slot : waiting[miss_keys[m]]) {
                results[slot] = vectors[m];
            }
            m_cache.put(miss_keys[m], std::move(vectors[m]));
        }
        return results;
    }

    std::vector<std::vector<float>> Vectorizer::call_backend(const std::vector<std::string>& texts) {
        std::vector<std::vector<std::string>> batches;
        for (size_t start = 0; start < texts.size(); start += m_batch_size) {
            size_t end = std::min(start + m_batch_size, texts.size());
            batches.emplace_back(texts.begin() + start, texts.begin() + end);
        }

        std::vector<std::vector<float>> out;
        out.reserve(texts.size());

        if (batches.size() == 1) {
            m_metrics.remote_call();
            return m_backend->embed_batch(batches.front());
        }

        // Several round-trips: run up to m_max_concurrent of them at once.
        std::exception_ptr failure;
        for (size_t wave = 0; wave < batches.size(); wave += m_max_concurrent) {
            size_t wave_end = std::min(wave + m_max_concurrent, batches.size());
            std::vector<std::future<std::vector<std::vector<float>>>> pending;
            for (size_t b = wave; b < wave_end; ++b) {
                m_metrics.remote_call();
                pending.push_back(std::async(std::launch::async, [this, &batches, b]() {
                    return m_backend->embed_batch(batches[b]);
                }));
            }
            for (auto& f : pending) {
                try {
                    auto part = f.get();
                    if (!failure) {
                        for (auto& v : part) out.push_back(std::move(v));
                    }
                } catch (const std::exception&) {
                    if (!failure) failure = std::current_exception();
                }
            }
            if (failure) std::rethrow_exception(failure);
        }
        return out;
    }

    void Vectorizer::warmup(const std::vector<std::string>& texts) {
        for (size_t start = 0; start < texts.size(); start += m_batch_size * m_max_concurrent) {
            size_t end = std::min(start + m_batch_size * m_max_concurrent, texts.size());
            embed_batch(std::vector<std::string>(texts.begin() + start, texts.begin() + end));
        }
    }

    void Vectorizer::clear_cache() {
        m_cache.clear();
    }

    size_t Vectorizer::cache_size() const {
        return m_cache.size();
    }

    size_t Vectorizer::cache_memory_bytes() const {
        return m_cache.memory_bytes();
    }

}
