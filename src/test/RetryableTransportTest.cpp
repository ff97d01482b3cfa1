#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "infrastructure/CancellationToken.hpp"
#include "infrastructure/RetryableTransport.hpp"
#include "TestHttpServer.hpp"

using namespace std::chrono_literals;
using docgen::infrastructure::CancellationToken;
using docgen::infrastructure::HttpRequest;
using docgen::infrastructure::RetryableTransport;

namespace {

std::atomic<int> g_flakyCalls{0};
std::atomic<int> g_unauthorizedCalls{0};
std::atomic<int> g_downCalls{0};
std::atomic<int> g_limitedCalls{0};

void Routes(httplib::Server& server) {
    server.Post("/flaky", [](const httplib::Request& req, httplib::Response& res) {
        if (g_flakyCalls.fetch_add(1) == 0) {
            res.status = 500;
            res.set_content("boom", "text/plain");
            return;
        }
        res.set_content("echo:" + req.body, "text/plain");
    });
    server.Post("/unauthorized", [](const httplib::Request&, httplib::Response& res) {
        g_unauthorizedCalls++;
        res.status = 401;
        res.set_content("{\"error\":\"bad key\"}", "application/json");
    });
    server.Post("/down", [](const httplib::Request&, httplib::Response& res) {
        g_downCalls++;
        res.status = 503;
        res.set_content("unavailable", "text/plain");
    });
    server.Post("/limited", [](const httplib::Request&, httplib::Response& res) {
        if (g_limitedCalls.fetch_add(1) == 0) {
            res.status = 429;
            return;
        }
        res.set_content("ok", "text/plain");
    });
    server.Get("/ping", [](const httplib::Request& req, httplib::Response& res) {
        res.set_content(req.get_header_value("X-Echo"), "text/plain");
    });
}

RetryableTransport::Options FastOptions(int retries) {
    RetryableTransport::Options options;
    options.timeout = 2000ms;
    options.maxRetries = retries;
    options.baseBackoff = 10ms;
    return options;
}

HttpRequest Post(const std::string& path, const std::string& body = "{}") {
    HttpRequest request;
    request.path = path;
    request.body = body;
    return request;
}

void TestRetriesServerErrorThenSucceeds(const TestHttpServer& upstream) {
    std::cout << "[Test] 500 then 200 is retried..." << std::endl;
    RetryableTransport transport(upstream.baseUrl(), FastOptions(2));
    auto res = transport.execute(Post("/flaky", "payload"));
    assert(res);
    assert(res->status == 200);
    assert(res->body == "echo:payload");
    assert(g_flakyCalls.load() == 2);
}

void TestClientErrorIsNotRetried(const TestHttpServer& upstream) {
    std::cout << "[Test] 401 is returned without retry..." << std::endl;
    RetryableTransport transport(upstream.baseUrl(), FastOptions(3));
    auto res = transport.execute(Post("/unauthorized"));
    assert(res);
    assert(res->status == 401);
    assert(g_unauthorizedCalls.load() == 1);
}

void TestRateLimitIsRetried(const TestHttpServer& upstream) {
    std::cout << "[Test] 429 is retried..." << std::endl;
    RetryableTransport transport(upstream.baseUrl(), FastOptions(1));
    auto res = transport.execute(Post("/limited"));
    assert(res);
    assert(res->status == 200);
    assert(g_limitedCalls.load() == 2);
}

void TestExhaustedRetriesReturnLastResponse(const TestHttpServer& upstream) {
    std::cout << "[Test] exhausted retries hand back the last response..." << std::endl;
    RetryableTransport transport(upstream.baseUrl(), FastOptions(2));
    auto res = transport.execute(Post("/down"));
    assert(res);
    assert(res->status == 503);
    assert(res->body == "unavailable");
    assert(g_downCalls.load() == 3);
}

void TestZeroRetriesMeansSingleAttempt(const TestHttpServer& upstream) {
    std::cout << "[Test] maxRetries=0 makes one attempt..." << std::endl;
    int before = g_downCalls.load();
    RetryableTransport transport(upstream.baseUrl(), FastOptions(0));
    auto res = transport.execute(Post("/down"));
    assert(res && res->status == 503);
    assert(g_downCalls.load() == before + 1);
}

void TestGetCarriesHeaders(const TestHttpServer& upstream) {
    std::cout << "[Test] GET with headers..." << std::endl;
    RetryableTransport transport(upstream.baseUrl(), FastOptions(0));
    HttpRequest request;
    request.method = "GET";
    request.path = "/ping";
    request.headers = {{"X-Echo", "hello"}};
    auto res = transport.execute(request);
    assert(res && res->status == 200);
    assert(res->body == "hello");
}

void TestTransportFailure() {
    std::cout << "[Test] connection failure surfaces as an error..." << std::endl;
    RetryableTransport transport("http://127.0.0.1:1", FastOptions(1));
    auto res = transport.execute(Post("/anything"));
    assert(!res);
    assert(res.error() != httplib::Error::Success);
    assert(res.error() != httplib::Error::Canceled);
}

void TestCancelDuringBackoff(const TestHttpServer& upstream) {
    std::cout << "[Test] cancellation interrupts the backoff wait..." << std::endl;
    int before = g_downCalls.load();

    RetryableTransport::Options options = FastOptions(3);
    options.baseBackoff = 10s;
    RetryableTransport transport(upstream.baseUrl(), options);

    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(200ms);
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto res = transport.execute(Post("/down"), &token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    assert(!res);
    assert(res.error() == httplib::Error::Canceled);
    assert(elapsed < 5s);
    assert(g_downCalls.load() == before + 1);
}

void TestCancelledBeforeFirstAttempt(const TestHttpServer& upstream) {
    std::cout << "[Test] pre-cancelled token sends nothing..." << std::endl;
    int before = g_downCalls.load();
    RetryableTransport transport(upstream.baseUrl(), FastOptions(2));
    CancellationToken token;
    token.cancel();
    auto res = transport.execute(Post("/down"), &token);
    assert(!res);
    assert(res.error() == httplib::Error::Canceled);
    assert(g_downCalls.load() == before);
}

void TestBackoffBounds() {
    std::cout << "[Test] backoff stays within +/-25% of base*2^n..." << std::endl;
    RetryableTransport::Options options;
    options.baseBackoff = 100ms;
    RetryableTransport transport("http://127.0.0.1:1", options);

    for (int n = 0; n < 4; ++n) {
        long long nominal = 100LL << n;
        long long low = nominal * 3 / 4 - 1;
        long long high = nominal * 5 / 4 + 1;
        for (int sample = 0; sample < 200; ++sample) {
            long long wait = transport.backoffFor(n).count();
            assert(wait >= low);
            assert(wait <= high);
        }
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting RetryableTransport tests..." << std::endl;
    TestHttpServer upstream(Routes);

    TestRetriesServerErrorThenSucceeds(upstream);
    TestClientErrorIsNotRetried(upstream);
    TestRateLimitIsRetried(upstream);
    TestExhaustedRetriesReturnLastResponse(upstream);
    TestZeroRetriesMeansSingleAttempt(upstream);
    TestGetCarriesHeaders(upstream);
    TestTransportFailure();
    TestCancelDuringBackoff(upstream);
    TestCancelledBeforeFirstAttempt(upstream);
    TestBackoffBounds();

    std::cout << "[PASS] RetryableTransport tests passed." << std::endl;
    return 0;
}
