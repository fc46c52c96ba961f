#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "engine/config.hpp"
#include "engine/document_store.hpp"
#include "engine/embedder.hpp"
#include "engine/query_engine.hpp"
#include "engine/storage.hpp"
#include "engine/vectorizer.hpp"
#include "quiver/errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

    constexpr size_t kDefaultLimit = 5;
    constexpr int64_t kMaxLimit = 1000;

    int64_t epoch_millis(quiver::Clock::time_point t) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    json to_json(const quiver::SearchResult& r) {
        return {
            {"document_id", r.document_id},
            {"title", r.title},
            {"content_snippet", r.content_snippet},
            {"similarity_score", r.similarity_score},
            {"package_name", r.package_name},
            {"doc_type", r.doc_type},
            {"language", r.language},
            {"version", r.version},
            {"metadata", r.metadata},
            {"match_type", r.match_type}
        };
    }

    json to_json(const quiver::DocumentRecord& rec) {
        const auto& d = rec.document;
        return {
            {"id", d.id},
            {"title", d.title},
            {"content", d.content},
            {"package_name", d.package_name},
            {"doc_type", d.doc_type},
            {"language", d.language},
            {"version", d.version},
            {"metadata", d.metadata},
            {"has_embedding", rec.has_embedding()},
            {"created_at", epoch_millis(rec.created_at)},
            {"updated_at", epoch_millis(rec.updated_at)}
        };
    }

    json to_json(const quiver::DatabaseStats& s) {
        return {
            {"document_count", s.document_count},
            {"vector_count", s.vector_count},
            {"total_size_mb", s.total_size_mb},
            {"memory_usage_mb", s.memory_usage_mb},
            {"index_size_mb", s.index_size_mb},
            {"last_updated", epoch_millis(s.last_updated)},
            {"cache_hits", s.cache_hits},
            {"cache_misses", s.cache_misses},
            {"cache_entries", s.cache_entries},
            {"queries", s.queries},
            {"degraded_queries", s.degraded_queries},
            {"degraded_writes", s.degraded_writes},
            {"index_rebuilds", s.index_rebuilds},
            {"mean_query_ms", s.mean_query_ms}
        };
    }

    quiver::Document document_from(const json& req) {
        quiver::Document doc;
        doc.id = req.value("id", "");
        doc.content = req.at("content").get<std::string>();
        doc.title = req.value("title", "");
        doc.package_name = req.value("package_name", "");
        doc.doc_type = req.value("doc_type", "");
        doc.language = req.value("language", "");
        doc.version = req.value("version", "");
        if (req.contains("metadata")) doc.metadata = req["metadata"].get<quiver::Metadata>();
        return doc;
    }

    json handle(const json& req, quiver::engine::DocumentStore& store, quiver::engine::QueryEngine& engine) {
        std::string action = req.value("action", "");

        if (action == "store") {
            if (!req.contains("content")) return {{"error", "missing content"}};
            return {{"id", store.add(document_from(req))}};
        }
        if (action == "search") {
            std::string query = req.value("query", "");
            int64_t limit = req.value("limit", static_cast<int64_t>(kDefaultLimit));
            if (limit <= 0) return {{"results", json::array()}};
            limit = std::min<int64_t>(limit, kMaxLimit);
            json results = json::array();
            for (const auto& r : engine.search(query, static_cast<size_t>(limit))) results.push_back(to_json(r));
            return {{"results", results}};
        }
        if (action == "get") {
            auto rec = store.get(req.value("id", ""));
            if (!rec) return {{"error", "not found"}};
            return to_json(*rec);
        }
        if (action == "delete") {
            if (req.contains("package_name")) {
                return {{"removed", store.remove_package(req["package_name"].get<std::string>(), req.value("version", ""))}};
            }
            return {{"removed", store.remove(req.value("id", "")) ? 1 : 0}};
        }
        if (action == "stats") return to_json(store.stats());
        if (action == "save") {
            store.save();
            return {{"saved", store.document_count()}};
        }
        return {{"error", "unknown action: " + action}};
    }

}

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = argc > 1 ? argv[1] : "quiver.json";

    quiver::engine::Config config;
    try {
        config = quiver::engine::Config::load(config_path);
    } catch (const quiver::ConfigError& e) {
        std::cerr << "[Quiver] Bad config: " << e.what() << "\n";
        return 1;
    }
    if (config.api_key.empty()) {
        if (const char* key = std::getenv("EMBEDDING_API_KEY")) config.api_key = key;
    }

    std::cerr << "[Quiver] Config path: " << config_path << "\n";
    std::cerr << "[Quiver] Data directory: " << config.data_dir << "\n";

    std::unique_ptr<quiver::engine::DocumentStore> store;
    try {
        std::shared_ptr<quiver::engine::EmbeddingBackend> backend = quiver::engine::create_backend(config);
        std::cerr << "[Quiver] Using " << backend->name() << " embedding backend.\n";
        auto vectorizer = std::make_shared<quiver::engine::Vectorizer>(backend, config);
        store = std::make_unique<quiver::engine::DocumentStore>(config, vectorizer, quiver::engine::create_storage(config));
        store->load();
    } catch (const quiver::Error& e) {
        std::cerr << "[Quiver] Failed to open store: " << e.what() << "\n";
        return 1;
    }
    quiver::engine::QueryEngine engine(*store, config);
    std::cerr << "[Quiver] Ready with " << store->document_count() << " documents.\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        json response;
        try {
            auto req = json::parse(line);
            response = handle(req, *store, engine);
            if (req.contains("request_id")) response["request_id"] = req["request_id"];
        } catch (const json::exception& e) {
            response = {{"error", std::string("invalid request: ") + e.what()}};
        } catch (const quiver::Error& e) {
            response = {{"error", e.what()}};
        }
        std::cout << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    try {
        store->save();
        std::cerr << "[Quiver] Saved " << store->document_count() << " documents.\n";
    } catch (const quiver::Error& e) {
        std::cerr << "[Quiver] Save failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
