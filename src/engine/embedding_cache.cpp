#include "embedding_cache.hpp"
#include <algorithm>
#include <mutex>

namespace quiver::engine {

    EmbeddingCache::EmbeddingCache(size_t capacity, std::chrono::seconds ttl)
        : m_capacity(capacity), m_ttl(ttl) {}

    bool EmbeddingCache::expired(const Entry& entry, std::chrono::steady_clock::time_point now) const {
        return m_ttl.count() > 0 && now - entry.inserted_at > m_ttl;
    }

    std::optional<std::vector<float>> EmbeddingCache::get(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        if (it == m_entries.end()) return std::nullopt;
        if (expired(it->second, std::chrono::steady_clock::now())) return std::nullopt;

        it->second.last_used.store(++m_tick, std::memory_order_relaxed);
        return it->second.vector;
    }

    void EmbeddingCache::put(const std::string& key, std::vector<float> vector) {
        if (m_capacity == 0) return;

        auto now = std::chrono::steady_clock::now();
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            if (m_entries.size() >= m_capacity) evict_locked(now);
            it = m_entries.try_emplace(key).first;
        }
        it->second.vector = std::move(vector);
        it->second.inserted_at = now;
        it->second.last_used.store(++m_tick, std::memory_order_relaxed);
    }

    void EmbeddingCache::evict_locked(std::chrono::steady_clock::time_point now) {
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (expired(it->second, now)) it = m_entries.erase(it);
            else ++it;
        }
        if (m_entries.size() < m_capacity) return;

        std::vector<uint64_t> ticks;
        ticks.reserve(m_entries.size());
        for (const auto& [key, entry] : m_entries) {
            ticks.push_back(entry.last_used.load(std::memory_order_relaxed));
        }
        size_t victims = std::max<size_t>(1, m_entries.size() / 10);
        std::nth_element(ticks.begin(), ticks.begin() + (victims - 1), ticks.end());
        uint64_t cutoff = ticks[victims - 1];

        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->second.last_used.load(std::memory_order_relaxed) <= cutoff) it = m_entries.erase(it);
            else ++it;
        }
    }

    size_t EmbeddingCache::size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.size();
    }

    void EmbeddingCache::clear() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_entries.clear();
    }

    size_t EmbeddingCache::memory_bytes() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        size_t bytes = 0;
        for (const auto& [key, entry] : m_entries) {
            bytes += key.size() + entry.vector.size() * sizeof(float) + sizeof(Entry);
        }
        return bytes;
    }

}
