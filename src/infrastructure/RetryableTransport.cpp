/**
 * @file RetryableTransport.cpp
 * @brief Implementation of RetryableTransport.
 */
#include "infrastructure/RetryableTransport.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <thread>
#include <utility>

namespace docgen::infrastructure {

namespace {

constexpr double kJitterFraction = 0.25;

httplib::Result CancelledResult() {
    return httplib::Result(nullptr, httplib::Error::Canceled);
}

double UniformJitter() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(-kJitterFraction, kJitterFraction);
    return dist(engine);
}

} // namespace

RetryableTransport::RetryableTransport(std::string baseUrl, Options options)
    : m_baseUrl(std::move(baseUrl)), m_options(options) {
    if (m_options.maxRetries < 0) m_options.maxRetries = 0;
}

bool RetryableTransport::IsRetryable(const httplib::Result& result) {
    if (!result) return true;
    int status = result->status;
    return status == 429 || (status >= 500 && status <= 599);
}

std::chrono::milliseconds RetryableTransport::backoffFor(int retryIndex) const {
    double base = static_cast<double>(m_options.baseBackoff.count()) * std::pow(2.0, retryIndex);
    double jittered = base * (1.0 + UniformJitter());
    return std::chrono::milliseconds(static_cast<long long>(std::llround(jittered)));
}

httplib::Result RetryableTransport::sendOnce(const HttpRequest& request) const {
    // A fresh client per call keeps concurrent requests independent.
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(m_options.timeout);
    cli.set_read_timeout(m_options.timeout);
    cli.set_write_timeout(m_options.timeout);

    if (request.method == "GET") {
        return cli.Get(request.path, request.headers);
    }
    return cli.Post(request.path, request.headers, request.body, request.contentType);
}

httplib::Result RetryableTransport::execute(const HttpRequest& request, const CancellationToken* cancel) const {
    httplib::Result last = CancelledResult();

    for (int attempt = 0; attempt <= m_options.maxRetries; ++attempt) {
        if (cancel && cancel->isCancelled()) {
            std::cerr << "[RetryableTransport] Cancelled before attempt " << (attempt + 1) << std::endl;
            return CancelledResult();
        }

        // Reassigning releases the previous attempt's response before the next call.
        last = sendOnce(request);
        if (!IsRetryable(last)) {
            return last;
        }
        if (attempt == m_options.maxRetries) {
            break;
        }

        auto wait = backoffFor(attempt);
        if (last) {
            std::cerr << "[RetryableTransport] " << request.method << " " << request.path
                      << " returned " << last->status;
        } else {
            std::cerr << "[RetryableTransport] " << request.method << " " << request.path
                      << " failed: error " << static_cast<int>(last.error());
        }
        std::cerr << ", retry " << (attempt + 1) << "/" << m_options.maxRetries
                  << " in " << wait.count() << "ms" << std::endl;

        if (cancel) {
            if (cancel->waitFor(wait)) {
                std::cerr << "[RetryableTransport] Cancelled during backoff" << std::endl;
                return CancelledResult();
            }
        } else {
            std::this_thread::sleep_for(wait);
        }
    }

    std::cerr << "[RetryableTransport] Giving up on " << request.path << " after "
              << (m_options.maxRetries + 1) << " attempts" << std::endl;
    return last;
}

} // namespace docgen::infrastructure
