#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quiver::engine {

    /**
     * @brief Concurrent content-keyed vector cache with capacity and TTL.
     *
     * Lookups share the lock; inserts take it exclusively. When the cache is
     * full, expired entries go first, then the least recently used tenth.
     */
    class EmbeddingCache {
    public:
        EmbeddingCache(size_t capacity, std::chrono::seconds ttl);

        std::optional<std::vector<float>> get(const std::string& key) const;
        void put(const std::string& key, std::vector<float> vector);

        size_t size() const;
        void clear();

        /**
         * @brief Approximate bytes held by cached vectors.
         */
        size_t memory_bytes() const;

    private:
        struct Entry {
            std::vector<float> vector;
            std::chrono::steady_clock::time_point inserted_at;
            mutable std::atomic<uint64_t> last_used{0};
        };

        bool expired(const Entry& entry, std::chrono::steady_clock::time_point now) const;
        void evict_locked(std::chrono::steady_clock::time_point now);

        size_t m_capacity;
        std::chrono::seconds m_ttl;
        mutable std::atomic<uint64_t> m_tick{0};
        mutable std::shared_mutex m_mutex;
        std::unordered_map<std::string, Entry> m_entries;
    };

}
