#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "quiver/types.hpp"
#include "config.hpp"

namespace quiver::engine {

    constexpr int kFormatVersion = 1;

    /**
     * @brief Contents of manifest.json, the root of a persisted store.
     */
    struct Manifest {
        int format_version = kFormatVersion;
        size_t dimension = 0;
        size_t record_count = 0;
        uint64_t generation = 0;
        std::string records_file;
        Clock::time_point saved_at{};
    };

    /**
     * @brief Durable home of a store's records. Whole-store save and load only.
     */
    class StorageBackend {
    public:
        virtual ~StorageBackend() = default;

        /**
         * @brief Replaces the persisted state with records. The previous state
         * stays readable until the new one is complete.
         * @throws StorageIO
         */
        virtual void save(const std::vector<DocumentRecord>& records, size_t dimension) = 0;

        /**
         * @brief Reads every record. An absent store loads as empty.
         * @throws StorageIO on read failure, SerializationError on corrupt,
         * foreign-version or wrong-dimension data. Never returns partial data.
         */
        virtual std::vector<DocumentRecord> load(size_t dimension) = 0;

        virtual std::optional<Manifest> manifest() const = 0;

        /**
         * @brief Bytes currently occupied on disk.
         */
        virtual uint64_t disk_bytes() const = 0;

        virtual std::string name() const = 0;
    };

    std::unique_ptr<StorageBackend> create_sqlite_storage(const std::filesystem::path& dir);

    /**
     * @brief Picks the backend named by config.storage_backend.
     * @throws ConfigError for an unknown name.
     */
    std::unique_ptr<StorageBackend> create_storage(const Config& config);

}
