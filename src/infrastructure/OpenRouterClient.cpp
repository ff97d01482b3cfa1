/**
 * @file OpenRouterClient.cpp
 * @brief Implementation of OpenRouterClient.
 */
#include "infrastructure/OpenRouterClient.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

#include "domain/Errors.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace docgen::infrastructure {

using json = nlohmann::json;
using domain::UpstreamError;

namespace {

struct UrlParts {
    std::string base; ///< scheme://host[:port]
    std::string path;
};

UrlParts SplitUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    std::size_t hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

[[noreturn]] void ThrowForStatus(int status, const std::string& body) {
    switch (status) {
        case 401:
            throw UpstreamError(UpstreamError::Kind::Unauthorized,
                                "unauthorized: check your OpenRouter API key", status, body);
        case 403:
            throw UpstreamError(UpstreamError::Kind::Forbidden,
                                "forbidden: you do not have permission to access this resource", status, body);
        case 429:
            throw UpstreamError(UpstreamError::Kind::RateLimited,
                                "rate limited: too many requests", status, body);
        default:
            break;
    }
    if (status >= 500 && status <= 599) {
        throw UpstreamError(UpstreamError::Kind::ServerError,
                            "upstream server error: status " + std::to_string(status), status, body);
    }
    throw UpstreamError(UpstreamError::Kind::Status,
                        "received non-2xx status code: " + std::to_string(status), status, body);
}

} // namespace

OpenRouterClient::OpenRouterClient(Settings settings)
    : m_settings(std::move(settings)),
      m_path(SplitUrl(m_settings.endpointUrl).path),
      m_transport(SplitUrl(m_settings.endpointUrl).base, m_settings.transport) {
    if (m_settings.apiKey.empty()) {
        throw domain::ConfigError("OPENROUTER_API_KEY is not set");
    }
}

httplib::Headers OpenRouterClient::buildHeaders() const {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + m_settings.apiKey}
    };
    if (!m_settings.referer.empty()) {
        headers.emplace("HTTP-Referer", m_settings.referer);
    }
    if (!m_settings.title.empty()) {
        headers.emplace("X-Title", m_settings.title);
    }
    return headers;
}

domain::ChatResponse OpenRouterClient::createChatCompletion(const domain::ChatRequest& request,
                                                            const CancellationToken* cancel) {
    HttpRequest httpRequest;
    httpRequest.method = "POST";
    httpRequest.path = m_path;
    httpRequest.headers = buildHeaders();
    httpRequest.body = JsonMapping::ToJson(request).dump();
    httpRequest.contentType = "application/json";

    std::cout << "[OpenRouterClient] Sending request to " << request.model
              << " (messages=" << request.messages.size()
              << ", format=" << request.responseFormat.value_or("text")
              << ", bytes=" << httpRequest.body.size() << ")" << std::endl;

    auto res = m_transport.execute(httpRequest, cancel);
    if (!res) {
        if (res.error() == httplib::Error::Canceled) {
            throw UpstreamError(UpstreamError::Kind::Cancelled, "request cancelled before completion");
        }
        std::cerr << "[OpenRouterClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        throw UpstreamError(UpstreamError::Kind::Transport,
                            "failed to send request: transport error " + std::to_string(static_cast<int>(res.error())));
    }

    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[OpenRouterClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        ThrowForStatus(res->status, res->body);
    }

    try {
        auto response = JsonMapping::ParseChatResponse(json::parse(res->body));
        std::cout << "[OpenRouterClient] Response received (" << res->body.size() << " bytes, "
                  << response.usage.totalTokens << " tokens)" << std::endl;
        return response;
    } catch (const std::exception& e) {
        std::cerr << "[OpenRouterClient] JSON Parse Error: " << e.what() << "\nBody: " << res->body << std::endl;
        throw UpstreamError(UpstreamError::Kind::Parse,
                            std::string("failed to unmarshal response: ") + e.what(), res->status, res->body);
    }
}

} // namespace docgen::infrastructure
