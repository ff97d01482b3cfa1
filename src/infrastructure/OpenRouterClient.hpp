/**
 * @file OpenRouterClient.hpp
 * @brief Chat-completion client for the OpenRouter API.
 */

#pragma once

#include <string>
#include <httplib.h>

#include "domain/ChatCompletion.hpp"
#include "infrastructure/RetryableTransport.hpp"

namespace docgen::infrastructure {

/**
 * @class OpenRouterClient
 * @brief Implements ChatCompletionService over a RetryableTransport.
 *
 * Maps provider statuses onto UpstreamError kinds: 401 Unauthorized,
 * 403 Forbidden, 429 RateLimited, 5xx ServerError, any other non-2xx Status.
 */
class OpenRouterClient : public domain::ChatCompletionService {
public:
    static constexpr const char* kDefaultEndpoint = "https://openrouter.ai/api/v1/chat/completions";

    struct Settings {
        std::string apiKey;
        std::string endpointUrl = kDefaultEndpoint;
        std::string referer; ///< Forwarded as HTTP-Referer when set.
        std::string title;   ///< Forwarded as X-Title when set.
        RetryableTransport::Options transport;
    };

    /** @throws domain::ConfigError if no api key is configured. */
    explicit OpenRouterClient(Settings settings);

    /** @see domain::ChatCompletionService::createChatCompletion */
    domain::ChatResponse createChatCompletion(const domain::ChatRequest& request,
                                              const CancellationToken* cancel = nullptr) override;

    /** @brief Headers attached to every outgoing request. */
    httplib::Headers buildHeaders() const;

private:
    Settings m_settings;
    std::string m_path;
    RetryableTransport m_transport;
};

} // namespace docgen::infrastructure
