#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "domain/Errors.hpp"
#include "infrastructure/OpenRouterClient.hpp"
#include "TestHttpServer.hpp"

using namespace std::chrono_literals;
using docgen::domain::ChatMessage;
using docgen::domain::ChatRequest;
using docgen::domain::UpstreamError;
using docgen::infrastructure::OpenRouterClient;
using json = nlohmann::json;

namespace {

struct Captured {
    std::mutex mutex;
    std::string authorization;
    std::string referer;
    std::string title;
    bool hadReferer = false;
    bool hadTitle = false;
    json body;
};

Captured g_captured;
std::atomic<int> g_unauthorizedCalls{0};

const char* kCompletion = R"({
    "id": "gen-123",
    "choices": [{"message": {"role": "assistant", "content": "{\"summary_md\":\"# Summary\"}"}}],
    "usage": {"prompt_tokens": 12, "completion_tokens": 30, "total_tokens": 42}
})";

void Routes(httplib::Server& server) {
    server.Post("/api/v1/chat/completions", [](const httplib::Request& req, httplib::Response& res) {
        {
            std::lock_guard<std::mutex> lock(g_captured.mutex);
            g_captured.authorization = req.get_header_value("Authorization");
            g_captured.hadReferer = req.has_header("HTTP-Referer");
            g_captured.hadTitle = req.has_header("X-Title");
            g_captured.referer = req.get_header_value("HTTP-Referer");
            g_captured.title = req.get_header_value("X-Title");
            g_captured.body = json::parse(req.body);
        }
        res.set_content(kCompletion, "application/json");
    });
    server.Post("/unauthorized", [](const httplib::Request&, httplib::Response& res) {
        g_unauthorizedCalls++;
        res.status = 401;
        res.set_content(R"({"error":{"message":"No auth credentials found"}})", "application/json");
    });
    server.Post("/forbidden", [](const httplib::Request&, httplib::Response& res) {
        res.status = 403;
        res.set_content("forbidden", "text/plain");
    });
    server.Post("/limited", [](const httplib::Request&, httplib::Response& res) {
        res.status = 429;
        res.set_content("slow down", "text/plain");
    });
    server.Post("/broken", [](const httplib::Request&, httplib::Response& res) {
        res.status = 502;
        res.set_content("bad gateway", "text/plain");
    });
    server.Post("/missing", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content("no such model", "text/plain");
    });
    server.Post("/garbage", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("this is not json", "text/plain");
    });
}

OpenRouterClient::Settings SettingsFor(const std::string& url) {
    OpenRouterClient::Settings settings;
    settings.apiKey = "test-key";
    settings.endpointUrl = url;
    settings.transport.timeout = 2000ms;
    settings.transport.maxRetries = 0;
    settings.transport.baseBackoff = 1ms;
    return settings;
}

ChatRequest SampleRequest() {
    ChatRequest request;
    request.model = "openrouter/auto";
    request.messages = {
        {ChatMessage::Role::System, "You are a helpful assistant."},
        {ChatMessage::Role::User, "Write a summary."}
    };
    request.responseFormat = "json_object";
    return request;
}

UpstreamError::Kind KindOf(const std::string& url) {
    OpenRouterClient client(SettingsFor(url));
    try {
        client.createChatCompletion(SampleRequest());
    } catch (const UpstreamError& e) {
        return e.kind();
    }
    assert(false && "expected UpstreamError");
    return UpstreamError::Kind::Status;
}

void TestSuccessfulCompletion(const TestHttpServer& upstream) {
    std::cout << "[Test] successful completion with attribution headers..." << std::endl;
    auto settings = SettingsFor(upstream.baseUrl() + "/api/v1/chat/completions");
    settings.referer = "https://example.test";
    settings.title = "DocGen Tests";
    OpenRouterClient client(settings);

    auto response = client.createChatCompletion(SampleRequest());
    assert(response.id == "gen-123");
    assert(response.choices.size() == 1);
    assert(response.choices[0].message.role == ChatMessage::Role::Assistant);
    assert(response.choices[0].message.content == "{\"summary_md\":\"# Summary\"}");
    assert(response.usage.totalTokens == 42);

    std::lock_guard<std::mutex> lock(g_captured.mutex);
    assert(g_captured.authorization == "Bearer test-key");
    assert(g_captured.referer == "https://example.test");
    assert(g_captured.title == "DocGen Tests");
    assert(g_captured.body["model"] == "openrouter/auto");
    assert(g_captured.body["messages"].size() == 2);
    assert(g_captured.body["messages"][0]["role"] == "system");
    assert(g_captured.body["messages"][1]["content"] == "Write a summary.");
    assert(g_captured.body["response_format"]["type"] == "json_object");
}

void TestOptionalHeadersOmitted(const TestHttpServer& upstream) {
    std::cout << "[Test] referer/title omitted when unset..." << std::endl;
    OpenRouterClient client(SettingsFor(upstream.baseUrl() + "/api/v1/chat/completions"));
    ChatRequest request = SampleRequest();
    request.responseFormat.reset();
    client.createChatCompletion(request);

    std::lock_guard<std::mutex> lock(g_captured.mutex);
    assert(!g_captured.hadReferer);
    assert(!g_captured.hadTitle);
    assert(!g_captured.body.contains("response_format"));
}

void TestStatusClassification(const TestHttpServer& upstream) {
    std::cout << "[Test] upstream status classification..." << std::endl;
    assert(KindOf(upstream.baseUrl() + "/unauthorized") == UpstreamError::Kind::Unauthorized);
    assert(KindOf(upstream.baseUrl() + "/forbidden") == UpstreamError::Kind::Forbidden);
    assert(KindOf(upstream.baseUrl() + "/limited") == UpstreamError::Kind::RateLimited);
    assert(KindOf(upstream.baseUrl() + "/broken") == UpstreamError::Kind::ServerError);
    assert(KindOf(upstream.baseUrl() + "/missing") == UpstreamError::Kind::Status);
    assert(KindOf("http://127.0.0.1:1/api/v1/chat/completions") == UpstreamError::Kind::Transport);
}

void TestUnauthorizedNotRetried(const TestHttpServer& upstream) {
    std::cout << "[Test] 401 is terminal even with retries left..." << std::endl;
    int before = g_unauthorizedCalls.load();
    auto settings = SettingsFor(upstream.baseUrl() + "/unauthorized");
    settings.transport.maxRetries = 3;
    OpenRouterClient client(settings);
    try {
        client.createChatCompletion(SampleRequest());
        assert(false && "expected UpstreamError");
    } catch (const UpstreamError& e) {
        assert(e.kind() == UpstreamError::Kind::Unauthorized);
        assert(e.status() == 401);
    }
    assert(g_unauthorizedCalls.load() == before + 1);
}

void TestParseErrorKeepsRawBody(const TestHttpServer& upstream) {
    std::cout << "[Test] unparseable body is reported with its raw text..." << std::endl;
    OpenRouterClient client(SettingsFor(upstream.baseUrl() + "/garbage"));
    try {
        client.createChatCompletion(SampleRequest());
        assert(false && "expected UpstreamError");
    } catch (const UpstreamError& e) {
        assert(e.kind() == UpstreamError::Kind::Parse);
        assert(e.rawBody() == "this is not json");
    }
}

void TestMissingKeyIsConfigError() {
    std::cout << "[Test] empty api key is rejected at construction..." << std::endl;
    auto settings = SettingsFor("http://127.0.0.1:1/api/v1/chat/completions");
    settings.apiKey.clear();
    bool threw = false;
    try {
        OpenRouterClient client(settings);
    } catch (const docgen::domain::ConfigError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting OpenRouterClient tests..." << std::endl;
    TestHttpServer upstream(Routes);

    TestSuccessfulCompletion(upstream);
    TestOptionalHeadersOmitted(upstream);
    TestStatusClassification(upstream);
    TestUnauthorizedNotRetried(upstream);
    TestParseErrorKeepsRawBody(upstream);
    TestMissingKeyIsConfigError();

    std::cout << "[PASS] OpenRouterClient tests passed." << std::endl;
    return 0;
}
