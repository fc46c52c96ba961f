#include "embedder.hpp"
#include "http.hpp"
#include "quiver/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>

using json = nlohmann::json;

namespace quiver::engine {

    /**
     * @brief Local Ollama server, batch endpoint /api/embed.
     */
    class OllamaBackend : public EmbeddingBackend {
    public:
        explicit OllamaBackend(const Config& config)
            : m_model(config.embedding_model),
              m_endpoint(config.embedding_endpoint),
              m_timeout_secs(config.request_timeout_secs),
              m_batch(config.batch_size),
              m_dimension(config.dimension) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OllamaBackend() override {
            curl_global_cleanup();
        }

        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
            if (texts.empty()) return {};

            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"input", texts}
                };
                json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw MalformedResponse(std::string("request serialization: ") + e.what());
            }

            auto response = http::post_json(m_endpoint, json_str, {}, m_timeout_secs);
            http::raise_for_status(response, "OllamaBackend");

            std::vector<std::vector<float>> embeddings;
            try {
                auto resp_json = json::parse(response.body);
                embeddings = resp_json.at("embeddings").get<std::vector<std::vector<float>>>();
            } catch (const json::exception& e) {
                throw MalformedResponse(e.what());
            }

            check_embeddings(embeddings, texts.size(), m_dimension);
            return embeddings;
        }

        size_t max_batch() const override { return m_batch; }
        std::string name() const override { return "ollama:" + m_model; }

    private:
        std::string m_model;
        std::string m_endpoint;
        long m_timeout_secs;
        size_t m_batch;
        size_t m_dimension;
    };

    std::unique_ptr<EmbeddingBackend> create_ollama_backend(const Config& config) {
        return std::make_unique<OllamaBackend>(config);
    }

}
