#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "engine/embedder.hpp"
#include "quiver/errors.hpp"

namespace quiver::test_support {

    /**
     * @brief Scripted in-process backend: hashing-trick vectors, optional
     * latency per call, switchable failure, call accounting.
     */
    class FakeBackend : public engine::EmbeddingBackend {
    public:
        enum class Failure { None, Network, Auth, RateLimit, Malformed };

        explicit FakeBackend(size_t dimension, std::chrono::milliseconds latency = std::chrono::milliseconds(0),
                             size_t max_batch = 64)
            : m_hashing(engine::create_hashing_backend(dimension)),
              m_dimension(dimension),
              m_latency(latency),
              m_max_batch(max_batch) {}

        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
            ++m_calls;
            m_inputs += texts.size();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_batch_sizes.push_back(texts.size());
            }
            if (m_latency.count() > 0) std::this_thread::sleep_for(m_latency);

            switch (m_failure.load()) {
                case Failure::Network: throw NetworkError("connection refused");
                case Failure::Auth: throw AuthFailure("401");
                case Failure::RateLimit: throw RateLimited("429");
                case Failure::Malformed: return {std::vector<float>(m_dimension + 1, 0.0f)};
                case Failure::None: break;
            }
            return m_hashing->embed_batch(texts);
        }

        size_t max_batch() const override { return m_max_batch; }
        std::string name() const override { return "fake"; }

        void fail_with(Failure failure) { m_failure = failure; }
        size_t calls() const { return m_calls.load(); }
        size_t inputs() const { return m_inputs.load(); }

        std::vector<size_t> batch_sizes() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_batch_sizes;
        }

    private:
        std::unique_ptr<engine::EmbeddingBackend> m_hashing;
        size_t m_dimension;
        std::chrono::milliseconds m_latency;
        size_t m_max_batch;
        std::atomic<Failure> m_failure{Failure::None};
        std::atomic<size_t> m_calls{0};
        std::atomic<size_t> m_inputs{0};
        mutable std::mutex m_mutex;
        std::vector<size_t> m_batch_sizes;
    };

    /**
     * @brief Fresh directory under the system temp dir, removed on destruction.
     */
    class TempDir {
    public:
        TempDir() {
            std::random_device rd;
            m_path = std::filesystem::temp_directory_path() /
                     ("quiver_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
            std::filesystem::create_directories(m_path);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

}
