/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the service layers.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace docgen::domain {

/** @brief Startup-time configuration failure. Process-fatal. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Caller supplied a request that cannot be served (unknown section, bad format...). */
class InvalidRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Artifact or file absent: expired, reclaimed or never created. */
class ArtifactNotFound : public std::runtime_error {
public:
    ArtifactNotFound(const std::string& id, const std::string& filename)
        : std::runtime_error("artifact not found: " + id + "/" + filename) {}
};

/**
 * @class UpstreamError
 * @brief Failure talking to the LLM provider, classified by kind.
 */
class UpstreamError : public std::runtime_error {
public:
    enum class Kind {
        Unauthorized,   ///< HTTP 401
        Forbidden,      ///< HTTP 403
        RateLimited,    ///< HTTP 429 after retries
        ServerError,    ///< HTTP 5xx after retries
        Status,         ///< Any other non-2xx status
        Transport,      ///< Connection/timeout failure after retries
        Cancelled,      ///< Caller abandoned the retry sequence
        Parse,          ///< Body or content could not be parsed
        EmptyResponse   ///< Provider returned no choices
    };

    UpstreamError(Kind kind, const std::string& message, int status = 0, std::string rawBody = {})
        : std::runtime_error(message), m_kind(kind), m_status(status), m_rawBody(std::move(rawBody)) {}

    Kind kind() const { return m_kind; }
    int status() const { return m_status; }
    /** @brief Raw upstream payload, kept for diagnosis of parse failures. */
    const std::string& rawBody() const { return m_rawBody; }

    static const char* KindToString(Kind kind) {
        switch (kind) {
            case Kind::Unauthorized: return "unauthorized";
            case Kind::Forbidden: return "forbidden";
            case Kind::RateLimited: return "rate_limited";
            case Kind::ServerError: return "server_error";
            case Kind::Status: return "status";
            case Kind::Transport: return "transport";
            case Kind::Cancelled: return "cancelled";
            case Kind::Parse: return "parse";
            case Kind::EmptyResponse: return "empty_response";
        }
        return "unknown";
    }

private:
    Kind m_kind;
    int m_status;
    std::string m_rawBody;
};

} // namespace docgen::domain
