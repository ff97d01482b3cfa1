/**
 * @file RetryableTransport.hpp
 * @brief HTTP execution with bounded retry and exponential backoff plus jitter.
 */

#pragma once

#include <chrono>
#include <string>
#include <httplib.h>

#include "infrastructure/CancellationToken.hpp"

namespace docgen::infrastructure {

/**
 * @struct HttpRequest
 * @brief Method, path, headers and body of one outgoing call.
 */
struct HttpRequest {
    std::string method = "POST";
    std::string path = "/";
    httplib::Headers headers;
    std::string body;
    std::string contentType = "application/json";
};

/**
 * @class RetryableTransport
 * @brief Retries transport failures, 429 and 5xx responses against one upstream host.
 *
 * Every other outcome is handed back untouched on the first attempt. When the
 * retry budget runs out the last result (error or non-2xx response) is returned
 * and classification is left to the caller.
 */
class RetryableTransport {
public:
    struct Options {
        std::chrono::milliseconds timeout{30000};
        int maxRetries = 1;
        std::chrono::milliseconds baseBackoff{2000};
    };

    /**
     * @param baseUrl scheme://host[:port] of the upstream.
     * @param options Timeout and retry budget.
     */
    RetryableTransport(std::string baseUrl, Options options);

    /**
     * @brief Executes @p request, retrying transient failures.
     * @param cancel Optional token; a cancelled sequence stops before the next
     *        attempt or during a backoff wait and yields httplib::Error::Canceled.
     */
    httplib::Result execute(const HttpRequest& request, const CancellationToken* cancel = nullptr) const;

    /** @brief Wait before retry number @p retryIndex (0-based): base * 2^n, +/-25% jitter. */
    std::chrono::milliseconds backoffFor(int retryIndex) const;

    /** @brief True for transport errors, 429 and 5xx. */
    static bool IsRetryable(const httplib::Result& result);

    const Options& options() const { return m_options; }

private:
    httplib::Result sendOnce(const HttpRequest& request) const;

    std::string m_baseUrl;
    Options m_options;
};

} // namespace docgen::infrastructure
