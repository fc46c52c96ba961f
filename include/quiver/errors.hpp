#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace quiver {

    /**
     * @brief Root of every exception thrown by the library.
     */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    class DimensionMismatch : public Error {
    public:
        DimensionMismatch(size_t expected, size_t actual)
            : Error("dimension mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual)),
              m_expected(expected), m_actual(actual) {}

        size_t expected() const { return m_expected; }
        size_t actual() const { return m_actual; }

    private:
        size_t m_expected;
        size_t m_actual;
    };

    /**
     * @brief The embedding backend cannot produce vectors right now.
     * Store and query code only ever catch this base type.
     */
    class EmbeddingUnavailable : public Error {
    public:
        explicit EmbeddingUnavailable(const std::string& what) : Error(what) {}
    };

    class AuthFailure : public EmbeddingUnavailable {
    public:
        explicit AuthFailure(const std::string& what) : EmbeddingUnavailable("authentication failed: " + what) {}
    };

    class RateLimited : public EmbeddingUnavailable {
    public:
        explicit RateLimited(const std::string& what) : EmbeddingUnavailable("rate limited: " + what) {}
    };

    class NetworkError : public EmbeddingUnavailable {
    public:
        explicit NetworkError(const std::string& what) : EmbeddingUnavailable("network error: " + what) {}
    };

    class MalformedResponse : public EmbeddingUnavailable {
    public:
        explicit MalformedResponse(const std::string& what) : EmbeddingUnavailable("malformed response: " + what) {}
    };

    class StorageIO : public Error {
    public:
        explicit StorageIO(const std::string& what) : Error("storage I/O: " + what) {}
    };

    class SerializationError : public Error {
    public:
        explicit SerializationError(const std::string& what) : Error("serialization: " + what) {}
    };

    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string& what) : Error("config: " + what) {}
    };

}
