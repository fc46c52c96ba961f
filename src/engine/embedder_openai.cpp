#include "embedder.hpp"
#include "http.hpp"
#include "quiver/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <iostream>

using json = nlohmann::json;

namespace quiver::engine {

    /**
     * @brief OpenAI-compatible /embeddings endpoint (OpenAI, NVIDIA NIM, vLLM, ...).
     */
    class OpenAIBackend : public EmbeddingBackend {
    public:
        explicit OpenAIBackend(const Config& config)
            : m_endpoint(config.embedding_endpoint),
              m_model(config.embedding_model),
              m_input_type(config.embedding_input_type),
              m_api_key(config.api_key),
              m_timeout_secs(config.request_timeout_secs),
              m_batch(config.batch_size),
              m_dimension(config.dimension) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OpenAIBackend() override {
            curl_global_cleanup();
        }

        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
            if (texts.empty()) return {};
            if (m_api_key.empty()) throw AuthFailure("no API key configured");

            json body = {
                {"model", m_model},
                {"input", texts},
                {"encoding_format", "float"}
            };
            if (!m_input_type.empty()) body["input_type"] = m_input_type;

            std::string json_str;
            try {
                json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw MalformedResponse(std::string("request serialization: ") + e.what());
            }

            auto response = http::post_json(m_endpoint, json_str, {"Authorization: Bearer " + m_api_key}, m_timeout_secs);
            http::raise_for_status(response, "OpenAIBackend");

            std::vector<std::vector<float>> embeddings;
            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("error")) {
                    std::cerr << "[OpenAIBackend] API Error: " << resp_json["error"].dump() << "\n";
                    throw MalformedResponse("API error payload");
                }
                const auto& data = resp_json.at("data");
                if (!data.is_array()) throw MalformedResponse("'data' is not an array");
                embeddings.resize(data.size());
                for (size_t i = 0; i < data.size(); ++i) {
                    const auto& item = data[i];
                    // Entries carry their input position; order them by it when present.
                    size_t slot = item.contains("index") ? item["index"].get<size_t>() : i;
                    if (slot >= embeddings.size()) throw MalformedResponse("embedding index out of range");
                    embeddings[slot] = item.at("embedding").get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                throw MalformedResponse(e.what());
            }

            check_embeddings(embeddings, texts.size(), m_dimension);
            return embeddings;
        }

        size_t max_batch() const override { return m_batch; }
        std::string name() const override { return "openai:" + m_model; }

    private:
        std::string m_endpoint;
        std::string m_model;
        std::string m_input_type;
        std::string m_api_key;
        long m_timeout_secs;
        size_t m_batch;
        size_t m_dimension;
    };

    std::unique_ptr<EmbeddingBackend> create_openai_backend(const Config& config) {
        return std::make_unique<OpenAIBackend>(config);
    }

}
