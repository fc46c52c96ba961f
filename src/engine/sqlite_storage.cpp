#include "storage.hpp"
#include "quiver/errors.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace quiver::engine {

    namespace {
        constexpr const char* kManifestName = "manifest.json";

        int64_t to_millis(Clock::time_point tp) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        }

        Clock::time_point from_millis(int64_t ms) {
            return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
        }

        // Lengths are explicit on both sides so embedded NULs survive.
        std::string column_text(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            if (!text) return "";
            return std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt, col));
        }

        void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
            sqlite3_bind_text(stmt, col, value.data(), static_cast<int>(value.size()), SQLITE_STATIC);
        }

        // Corrupt files are a data problem, everything else an I/O problem.
        [[noreturn]] void raise(sqlite3* db, int rc, const std::string& what) {
            std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
            std::cerr << "[SqliteStorage] " << msg << "\n";
            if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) throw SerializationError(msg);
            throw StorageIO(msg);
        }

        class Connection {
        public:
            Connection(const fs::path& path, int flags) {
                int rc = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
                if (rc != SQLITE_OK) {
                    std::string msg = "open " + path.string() + ": " + (m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc));
                    sqlite3_close(m_db);
                    m_db = nullptr;
                    std::cerr << "[SqliteStorage] " << msg << "\n";
                    if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) throw SerializationError(msg);
                    throw StorageIO(msg);
                }
            }

            ~Connection() { sqlite3_close(m_db); }

            Connection(const Connection&) = delete;
            Connection& operator=(const Connection&) = delete;

            void exec(const char* sql) {
                char* err_msg = nullptr;
                int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg);
                if (rc != SQLITE_OK) {
                    std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
                    sqlite3_free(err_msg);
                    std::cerr << "[SqliteStorage] " << msg << "\n";
                    if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) throw SerializationError(msg);
                    throw StorageIO(msg);
                }
            }

            sqlite3* get() const { return m_db; }

        private:
            sqlite3* m_db = nullptr;
        };

        class Statement {
        public:
            Statement(Connection& conn, const char* sql) : m_conn(conn) {
                int rc = sqlite3_prepare_v2(conn.get(), sql, -1, &m_stmt, nullptr);
                if (rc != SQLITE_OK) raise(conn.get(), rc, "prepare");
            }

            ~Statement() { sqlite3_finalize(m_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            // true while a row is available
            bool step() {
                int rc = sqlite3_step(m_stmt);
                if (rc == SQLITE_ROW) return true;
                if (rc == SQLITE_DONE) return false;
                raise(m_conn.get(), rc, "step");
            }

            void reset() {
                sqlite3_reset(m_stmt);
                sqlite3_clear_bindings(m_stmt);
            }

            sqlite3_stmt* get() const { return m_stmt; }

        private:
            Connection& m_conn;
            sqlite3_stmt* m_stmt = nullptr;
        };

        const char* kSchema =
            "CREATE TABLE IF NOT EXISTS meta ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS documents ("
            "  id TEXT PRIMARY KEY,"
            "  title TEXT,"
            "  content TEXT NOT NULL,"
            "  package_name TEXT,"
            "  doc_type TEXT,"
            "  language TEXT,"
            "  version TEXT,"
            "  metadata TEXT,"
            "  embedding BLOB,"
            "  created_at INTEGER,"
            "  updated_at INTEGER"
            ");";
    }

    class SqliteStorage : public StorageBackend {
    public:
        explicit SqliteStorage(fs::path dir) : m_dir(std::move(dir)) {}

        void save(const std::vector<DocumentRecord>& records, size_t dimension) override {
            std::error_code ec;
            fs::create_directories(m_dir, ec);
            if (ec) throw StorageIO("create " + m_dir.string() + ": " + ec.message());

            uint64_t generation = 1;
            if (auto current = read_manifest_if_valid()) generation = current->generation + 1;

            std::string records_name = "records-" + std::to_string(generation) + ".db";
            fs::path final_path = m_dir / records_name;
            fs::path tmp_path = m_dir / (records_name + ".tmp");
            fs::remove(tmp_path, ec);
            fs::remove(fs::path(tmp_path.string() + "-journal"), ec);

            try {
                write_records(tmp_path, records, dimension);
            } catch (const Error&) {
                fs::remove(tmp_path, ec);
                fs::remove(fs::path(tmp_path.string() + "-journal"), ec);
                throw;
            }
            rename_or_throw(tmp_path, final_path);

            Manifest manifest;
            manifest.dimension = dimension;
            manifest.record_count = records.size();
            manifest.generation = generation;
            manifest.records_file = records_name;
            manifest.saved_at = Clock::now();
            write_manifest(manifest);

            remove_stale_generations(records_name);
        }

        std::vector<DocumentRecord> load(size_t dimension) override {
            fs::path manifest_path = m_dir / kManifestName;
            if (!fs::exists(manifest_path)) return {};

            Manifest manifest = read_manifest(manifest_path);
            if (manifest.format_version != kFormatVersion) {
                throw SerializationError("unsupported format version " + std::to_string(manifest.format_version) +
                                         " (this build reads " + std::to_string(kFormatVersion) + ")");
            }
            if (manifest.dimension != dimension) {
                throw SerializationError("store dimension " + std::to_string(manifest.dimension) +
                                         " does not match configured dimension " + std::to_string(dimension));
            }

            fs::path records_path = m_dir / manifest.records_file;
            if (manifest.records_file.empty() || !fs::exists(records_path)) {
                throw SerializationError("manifest references missing records file '" + manifest.records_file + "'");
            }

            auto records = read_records(records_path, dimension);
            if (records.size() != manifest.record_count) {
                throw SerializationError("manifest lists " + std::to_string(manifest.record_count) +
                                         " records, file holds " + std::to_string(records.size()));
            }
            return records;
        }

        std::optional<Manifest> manifest() const override {
            return read_manifest_if_valid();
        }

        uint64_t disk_bytes() const override {
            uint64_t total = 0;
            std::error_code ec;
            if (!fs::exists(m_dir, ec)) return 0;
            for (const auto& entry : fs::directory_iterator(m_dir, ec)) {
                if (entry.is_regular_file(ec)) total += entry.file_size(ec);
            }
            return total;
        }

        std::string name() const override { return "sqlite:" + m_dir.string(); }

    private:
        fs::path m_dir;

        void write_records(const fs::path& path, const std::vector<DocumentRecord>& records, size_t dimension) {
            Connection conn(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
            conn.exec(kSchema);
            conn.exec("BEGIN;");

            Statement meta(conn, "INSERT INTO meta (key, value) VALUES (?, ?);");
            auto put_meta = [&](const char* key, const std::string& value) {
                sqlite3_bind_text(meta.get(), 1, key, -1, SQLITE_STATIC);
                sqlite3_bind_text(meta.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
                meta.step();
                meta.reset();
            };
            put_meta("format_version", std::to_string(kFormatVersion));
            put_meta("dimension", std::to_string(dimension));

            Statement insert(conn,
                "INSERT INTO documents (id, title, content, package_name, doc_type, language, version, "
                "metadata, embedding, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");

            for (const auto& record : records) {
                const Document& doc = record.document;
                std::string metadata;
                try {
                    metadata = json(doc.metadata).dump();
                } catch (const json::exception& e) {
                    throw SerializationError("metadata of '" + doc.id + "': " + e.what());
                }

                sqlite3_stmt* stmt = insert.get();
                bind_text(stmt, 1, doc.id);
                bind_text(stmt, 2, doc.title);
                bind_text(stmt, 3, doc.content);
                bind_text(stmt, 4, doc.package_name);
                bind_text(stmt, 5, doc.doc_type);
                bind_text(stmt, 6, doc.language);
                bind_text(stmt, 7, doc.version);
                bind_text(stmt, 8, metadata);
                if (record.has_embedding()) {
                    sqlite3_bind_blob(stmt, 9, record.embedding.data(),
                                      static_cast<int>(record.embedding.size() * sizeof(float)), SQLITE_STATIC);
                } else {
                    sqlite3_bind_null(stmt, 9);
                }
                sqlite3_bind_int64(stmt, 10, to_millis(record.created_at));
                sqlite3_bind_int64(stmt, 11, to_millis(record.updated_at));

                insert.step();
                insert.reset();
            }

            conn.exec("COMMIT;");
        }

        std::vector<DocumentRecord> read_records(const fs::path& path, size_t dimension) {
            Connection conn(path, SQLITE_OPEN_READONLY);

            Statement meta(conn, "SELECT value FROM meta WHERE key = 'format_version';");
            if (!meta.step() || column_text(meta.get(), 0) != std::to_string(kFormatVersion)) {
                throw SerializationError("records file " + path.filename().string() + " has a foreign format version");
            }

            std::vector<DocumentRecord> records;
            Statement select(conn,
                "SELECT id, title, content, package_name, doc_type, language, version, "
                "metadata, embedding, created_at, updated_at FROM documents ORDER BY id;");

            while (select.step()) {
                sqlite3_stmt* stmt = select.get();
                DocumentRecord record;
                Document& doc = record.document;
                doc.id = column_text(stmt, 0);
                doc.title = column_text(stmt, 1);
                doc.content = column_text(stmt, 2);
                doc.package_name = column_text(stmt, 3);
                doc.doc_type = column_text(stmt, 4);
                doc.language = column_text(stmt, 5);
                doc.version = column_text(stmt, 6);

                try {
                    std::string metadata = column_text(stmt, 7);
                    if (!metadata.empty()) doc.metadata = json::parse(metadata).get<Metadata>();
                } catch (const json::exception& e) {
                    throw SerializationError("metadata of '" + doc.id + "': " + e.what());
                }

                const void* blob = sqlite3_column_blob(stmt, 8);
                int bytes = sqlite3_column_bytes(stmt, 8);
                if (blob && bytes > 0) {
                    if (static_cast<size_t>(bytes) != dimension * sizeof(float)) {
                        throw SerializationError("embedding of '" + doc.id + "' has " + std::to_string(bytes) +
                                                 " bytes, expected " + std::to_string(dimension * sizeof(float)));
                    }
                    record.embedding.resize(dimension);
                    memcpy(record.embedding.data(), blob, bytes);
                }

                record.created_at = from_millis(sqlite3_column_int64(stmt, 9));
                record.updated_at = from_millis(sqlite3_column_int64(stmt, 10));
                records.push_back(std::move(record));
            }
            return records;
        }

        void write_manifest(const Manifest& manifest) {
            json j = {
                {"format_version", manifest.format_version},
                {"dimension", manifest.dimension},
                {"record_count", manifest.record_count},
                {"generation", manifest.generation},
                {"records_file", manifest.records_file},
                {"saved_at", to_millis(manifest.saved_at)}
            };

            fs::path final_path = m_dir / kManifestName;
            fs::path tmp_path = m_dir / (std::string(kManifestName) + ".tmp");
            {
                std::ofstream f(tmp_path, std::ios::trunc);
                f << j.dump(4);
                f.flush();
                if (!f) throw StorageIO("write " + tmp_path.string());
            }
            rename_or_throw(tmp_path, final_path);
        }

        Manifest read_manifest(const fs::path& path) const {
            std::ifstream f(path);
            if (!f) throw StorageIO("open " + path.string());

            try {
                json j = json::parse(f);
                Manifest m;
                m.format_version = j.at("format_version").get<int>();
                m.dimension = j.at("dimension").get<size_t>();
                m.record_count = j.at("record_count").get<size_t>();
                m.generation = j.at("generation").get<uint64_t>();
                m.records_file = j.at("records_file").get<std::string>();
                m.saved_at = from_millis(j.at("saved_at").get<int64_t>());
                return m;
            } catch (const json::exception& e) {
                throw SerializationError("manifest " + path.string() + ": " + e.what());
            }
        }

        std::optional<Manifest> read_manifest_if_valid() const {
            fs::path path = m_dir / kManifestName;
            if (!fs::exists(path)) return std::nullopt;
            try {
                return read_manifest(path);
            } catch (const Error& e) {
                std::cerr << "[SqliteStorage] Ignoring unreadable manifest: " << e.what() << "\n";
                return std::nullopt;
            }
        }

        static void rename_or_throw(const fs::path& from, const fs::path& to) {
            std::error_code ec;
            fs::rename(from, to, ec);
            if (ec) throw StorageIO("rename " + from.string() + " -> " + to.string() + ": " + ec.message());
        }

        void remove_stale_generations(const std::string& keep) {
            std::error_code ec;
            for (const auto& entry : fs::directory_iterator(m_dir, ec)) {
                std::string name = entry.path().filename().string();
                if (name == keep || name.rfind("records-", 0) != 0) continue;
                fs::remove(entry.path(), ec);
                if (ec) std::cerr << "[SqliteStorage] Could not remove " << name << ": " << ec.message() << "\n";
            }
        }
    };

    std::unique_ptr<StorageBackend> create_sqlite_storage(const fs::path& dir) {
        return std::make_unique<SqliteStorage>(dir);
    }

    std::unique_ptr<StorageBackend> create_storage(const Config& config) {
        if (config.storage_backend == "sqlite") return create_sqlite_storage(config.data_dir);
        throw ConfigError("unknown storage backend '" + config.storage_backend + "'");
    }

}
