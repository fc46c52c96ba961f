#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "quiver/types.hpp"
#include "ann_index.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include "storage.hpp"
#include "vectorizer.hpp"

namespace quiver::engine {

    /**
     * @brief Owns the document records, their persistence and the derived ANN index.
     *
     * Writes never wait on the embedding backend while holding the record
     * lock, and never fail because embeddings are unavailable: such
     * documents are kept without a vector until they are re-added.
     */
    class DocumentStore {
    public:
        DocumentStore(const Config& config, std::shared_ptr<Vectorizer> vectorizer,
                      std::unique_ptr<StorageBackend> storage,
                      MetricsCollector& metrics = MetricsCollector::global());

        DocumentStore(const DocumentStore&) = delete;
        DocumentStore& operator=(const DocumentStore&) = delete;

        /**
         * @brief Vectorizes and stores a document, replacing any record with the same id.
         * @return The document id (generated when the document has none).
         */
        std::string add(Document document);

        /**
         * @brief Like add(), with one embedding round for the whole batch.
         */
        std::vector<std::string> add_batch(std::vector<Document> documents);

        std::optional<DocumentRecord> get(const std::string& id) const;
        bool contains(const std::string& id) const;

        /**
         * @return true if a record was removed.
         */
        bool remove(const std::string& id);

        /**
         * @brief Removes every document of a package; an empty version matches all versions.
         * @return Number of documents removed.
         */
        size_t remove_package(const std::string& package_name, const std::string& version = "");

        /**
         * @throws StorageIO
         */
        void save() const;

        /**
         * @brief Replaces the in-memory records with the persisted ones. The index
         * is left Empty and rebuilt on the next search.
         * @throws StorageIO, SerializationError; the store is unchanged on failure.
         */
        void load();

        /**
         * @brief Snapshot of counters. Never throws.
         */
        DatabaseStats stats() const;

        /**
         * @brief Every record with an embedding, as index points.
         */
        std::vector<VectorPoint> snapshot_points() const;

        /**
         * @brief Records for the given ids, in the same order; unknown ids are skipped.
         */
        std::vector<DocumentRecord> records_for(const std::vector<std::string>& ids) const;

        std::vector<DocumentRecord> all_records() const;

        /**
         * @brief Every record, for keyword-only scoring when no query vector is available.
         */
        std::vector<DocumentRecord> keyword_candidates() const { return all_records(); }

        size_t document_count() const;
        size_t vector_count() const;
        size_t dimension() const { return m_dimension; }

        AnnIndex& index() { return m_index; }
        const AnnIndex& index() const { return m_index; }
        Vectorizer& vectorizer() { return *m_vectorizer; }

        static std::string generate_id();

        /**
         * @brief Text sent to the embedding backend: descriptive header, blank line, content.
         */
        static std::string vectorization_text(const Document& document);

    private:
        std::vector<std::vector<float>> embed_documents(const std::vector<std::string>& texts);
        void erase_locked(std::map<std::string, DocumentRecord>::iterator it);
        void insert_locked(DocumentRecord record);
        static size_t record_bytes(const DocumentRecord& record);

        size_t m_dimension;
        size_t m_max_text_bytes;
        size_t m_chunk_overlap;
        std::shared_ptr<Vectorizer> m_vectorizer;
        std::unique_ptr<StorageBackend> m_storage;
        MetricsCollector& m_metrics;
        AnnIndex m_index;

        mutable std::shared_mutex m_mutex;
        std::map<std::string, DocumentRecord> m_records;
        size_t m_vector_count = 0;
        size_t m_record_bytes = 0;
        Clock::time_point m_last_updated{};

        mutable std::mutex m_save_mutex;
    };

}
