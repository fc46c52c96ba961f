#include "document_store.hpp"
#include "quiver/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <random>

namespace quiver::engine {

    namespace {
        constexpr double kMiB = 1024.0 * 1024.0;
    }

    DocumentStore::DocumentStore(const Config& config, std::shared_ptr<Vectorizer> vectorizer,
                                 std::unique_ptr<StorageBackend> storage, MetricsCollector& metrics)
        : m_dimension(config.dimension),
          m_max_text_bytes(config.max_text_bytes),
          m_chunk_overlap(config.chunk_overlap_bytes),
          m_vectorizer(std::move(vectorizer)),
          m_storage(std::move(storage)),
          m_metrics(metrics),
          m_index(config.dimension, config, metrics) {
        if (!m_vectorizer) throw ConfigError("document store needs a vectorizer");
        if (!m_storage) throw ConfigError("document store needs a storage backend");
        if (m_vectorizer->dimension() != m_dimension) {
            throw ConfigError("vectorizer dimension " + std::to_string(m_vectorizer->dimension()) +
                              " differs from store dimension " + std::to_string(m_dimension));
        }
        m_index.set_snapshot_provider([this]() { return snapshot_points(); });
    }

    std::string DocumentStore::generate_id() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        uint64_t hi = rng();
        uint64_t lo = rng();
        // RFC 4122 version 4, variant 1
        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        char buf[37];
        std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                      static_cast<unsigned>(hi >> 32),
                      static_cast<unsigned>((hi >> 16) & 0xFFFF),
                      static_cast<unsigned>(hi & 0xFFFF),
                      static_cast<unsigned>(lo >> 48),
                      static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    std::string DocumentStore::vectorization_text(const Document& document) {
        std::string header;
        auto field = [&header](const char* label, const std::string& value) {
            if (!value.empty()) header += std::string(label) + ": " + value + "\n";
        };
        field("Title", document.title);
        field("Package", document.package_name);
        field("Version", document.version);
        field("Language", document.language);
        field("Type", document.doc_type);

        if (header.empty()) return document.content;
        return header + "\n" + document.content;
    }

    std::vector<std::vector<float>> DocumentStore::embed_documents(const std::vector<std::string>& texts) {
        // Long texts are embedded chunk by chunk and averaged; everything goes out in one batch.
        std::vector<std::string> pieces;
        std::vector<std::pair<size_t, size_t>> spans(texts.size(), {0, 0});
        for (size_t i = 0; i < texts.size(); ++i) {
            if (normalize_text(texts[i]).empty()) continue;
            size_t first = pieces.size();
            if (texts[i].size() > m_max_text_bytes) {
                for (auto& chunk : Chunker::split(texts[i], m_max_text_bytes, m_chunk_overlap)) {
                    pieces.push_back(std::move(chunk));
                }
            } else {
                pieces.push_back(texts[i]);
            }
            spans[i] = {first, pieces.size()};
        }

        std::vector<std::vector<float>> vectors(texts.size());
        if (pieces.empty()) return vectors;

        auto embedded = m_vectorizer->embed_batch(pieces);
        for (size_t i = 0; i < texts.size(); ++i) {
            auto [first, last] = spans[i];
            if (first == last) continue;
            if (last - first == 1) {
                vectors[i] = std::move(embedded[first]);
                continue;
            }
            std::vector<float> merged(m_dimension, 0.0f);
            for (size_t p = first; p < last; ++p) {
                for (size_t d = 0; d < m_dimension; ++d) merged[d] += embedded[p][d];
            }
            float count = static_cast<float>(last - first);
            for (float& v : merged) v /= count;
            vectors[i] = std::move(merged);
        }
        return vectors;
    }

    std::string DocumentStore::add(Document document) {
        return add_batch({std::move(document)}).front();
    }

    std::vector<std::string> DocumentStore::add_batch(std::vector<Document> documents) {
        std::vector<std::string> ids;
        std::vector<std::string> texts;
        ids.reserve(documents.size());
        texts.reserve(documents.size());
        for (auto& doc : documents) {
            if (doc.id.empty()) doc.id = generate_id();
            ids.push_back(doc.id);
            texts.push_back(vectorization_text(doc));
        }
        if (documents.empty()) return ids;

        std::vector<std::vector<float>> vectors;
        try {
            vectors = embed_documents(texts);
        } catch (const EmbeddingUnavailable& e) {
            std::cerr << "[DocumentStore] Embedding unavailable, storing " << documents.size()
                      << " document(s) without vectors: " << e.what() << "\n";
            m_metrics.degraded_write(documents.size());
            vectors.assign(documents.size(), {});
        }

        for (const auto& v : vectors) {
            if (!v.empty() && v.size() != m_dimension) throw DimensionMismatch(m_dimension, v.size());
        }

        auto now = Clock::now();
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            for (size_t i = 0; i < documents.size(); ++i) {
                DocumentRecord record;
                record.created_at = now;
                record.updated_at = now;
                auto existing = m_records.find(documents[i].id);
                if (existing != m_records.end()) {
                    record.created_at = existing->second.created_at;
                    erase_locked(existing);
                }
                record.document = std::move(documents[i]);
                record.embedding = std::move(vectors[i]);
                insert_locked(std::move(record));
            }
            m_last_updated = now;
        }
        m_index.mark_stale();
        return ids;
    }

    void DocumentStore::insert_locked(DocumentRecord record) {
        m_record_bytes += record_bytes(record);
        if (record.has_embedding()) ++m_vector_count;
        std::string id = record.id();
        m_records.emplace(std::move(id), std::move(record));
    }

    void DocumentStore::erase_locked(std::map<std::string, DocumentRecord>::iterator it) {
        m_record_bytes -= record_bytes(it->second);
        if (it->second.has_embedding()) --m_vector_count;
        m_records.erase(it);
    }

    size_t DocumentStore::record_bytes(const DocumentRecord& record) {
        const Document& d = record.document;
        size_t bytes = d.id.size() + d.title.size() + d.content.size() + d.package_name.size() +
                       d.doc_type.size() + d.language.size() + d.version.size();
        for (const auto& [key, value] : d.metadata) bytes += key.size() + value.size();
        return bytes + record.embedding.size() * sizeof(float);
    }

    std::optional<DocumentRecord> DocumentStore::get(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) return std::nullopt;
        return it->second;
    }

    bool DocumentStore::contains(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_records.count(id) > 0;
    }

    bool DocumentStore::remove(const std::string& id) {
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_records.find(id);
            if (it == m_records.end()) return false;
            erase_locked(it);
            m_last_updated = Clock::now();
        }
        m_index.mark_stale();
        return true;
    }

    size_t DocumentStore::remove_package(const std::string& package_name, const std::string& version) {
        size_t removed = 0;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            for (auto it = m_records.begin(); it != m_records.end();) {
                const Document& doc = it->second.document;
                bool match = doc.package_name == package_name && (version.empty() || doc.version == version);
                auto next = std::next(it);
                if (match) {
                    erase_locked(it);
                    ++removed;
                }
                it = next;
            }
            if (removed > 0) m_last_updated = Clock::now();
        }
        if (removed > 0) m_index.mark_stale();
        return removed;
    }

    void DocumentStore::save() const {
        std::lock_guard<std::mutex> save_lock(m_save_mutex);
        auto records = all_records();
        m_storage->save(records, m_dimension);
    }

    void DocumentStore::load() {
        std::lock_guard<std::mutex> save_lock(m_save_mutex);
        auto records = m_storage->load(m_dimension);

        Clock::time_point last{};
        for (const auto& record : records) {
            if (record.has_embedding() && record.embedding.size() != m_dimension) {
                throw SerializationError("record '" + record.id() + "' has a " +
                                         std::to_string(record.embedding.size()) + "-dimensional embedding");
            }
            last = std::max(last, record.updated_at);
        }

        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            m_records.clear();
            m_vector_count = 0;
            m_record_bytes = 0;
            for (auto& record : records) insert_locked(std::move(record));
            m_last_updated = last;
        }
        m_index.reset();
    }

    DatabaseStats DocumentStore::stats() const {
        DatabaseStats stats;
        size_t record_bytes = 0;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            stats.document_count = m_records.size();
            stats.vector_count = m_vector_count;
            stats.last_updated = m_last_updated;
            record_bytes = m_record_bytes;
        }

        size_t index_bytes = m_index.memory_bytes();
        size_t cache_bytes = m_vectorizer->cache_memory_bytes();
        stats.total_size_mb = static_cast<double>(record_bytes) / kMiB;
        stats.index_size_mb = static_cast<double>(index_bytes) / kMiB;
        stats.memory_usage_mb = static_cast<double>(record_bytes + index_bytes + cache_bytes) / kMiB;

        auto metrics = m_metrics.snapshot();
        stats.cache_hits = metrics.cache_hits;
        stats.cache_misses = metrics.cache_misses;
        stats.cache_entries = m_vectorizer->cache_size();
        stats.queries = metrics.queries;
        stats.degraded_queries = metrics.degraded_queries;
        stats.degraded_writes = metrics.degraded_writes;
        stats.index_rebuilds = metrics.index_rebuilds;
        stats.mean_query_ms = metrics.mean_query_ms();
        return stats;
    }

    std::vector<VectorPoint> DocumentStore::snapshot_points() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<VectorPoint> points;
        points.reserve(m_vector_count);
        for (const auto& [id, record] : m_records) {
            if (record.has_embedding()) points.push_back({record.embedding, id});
        }
        return points;
    }

    std::vector<DocumentRecord> DocumentStore::records_for(const std::vector<std::string>& ids) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<DocumentRecord> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            auto it = m_records.find(id);
            if (it != m_records.end()) out.push_back(it->second);
        }
        return out;
    }

    std::vector<DocumentRecord> DocumentStore::all_records() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<DocumentRecord> out;
        out.reserve(m_records.size());
        for (const auto& [id, record] : m_records) out.push_back(record);
        return out;
    }

    size_t DocumentStore::document_count() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_records.size();
    }

    size_t DocumentStore::vector_count() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_vector_count;
    }

}
