#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>

#include "app/DocGenServer.hpp"
#include "application/DocumentOrchestrator.hpp"
#include "application/ExportService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OpenRouterClient.hpp"

namespace fs = std::filesystem;
using namespace docgen;

namespace {

std::optional<fs::path> SettingsFileFromArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            return fs::path(argv[i + 1]);
        }
        const std::string prefix = "--config=";
        if (arg.rfind(prefix, 0) == 0) {
            return fs::path(arg.substr(prefix.size()));
        }
    }
    if (const char* env = std::getenv("DOCGEN_CONFIG"); env && *env) {
        return fs::path(env);
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    // Block termination signals before any worker thread exists; a dedicated thread waits for them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    infrastructure::ServiceConfig config;
    try {
        config = infrastructure::ConfigLoader::Load(SettingsFileFromArgs(argc, argv));
    } catch (const domain::ConfigError& e) {
        std::cerr << "[DocGen] Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<infrastructure::ArtifactStore> store;
    try {
        store = std::make_unique<infrastructure::ArtifactStore>(config.artifactDir, config.artifactTtl);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[DocGen] Cannot prepare artifact directory: " << e.what() << std::endl;
        return 1;
    }
    store->startJanitor(config.janitorInterval);

    infrastructure::OpenRouterClient::Settings upstream;
    upstream.apiKey = config.apiKey;
    upstream.endpointUrl = config.apiUrl;
    upstream.referer = config.referer;
    upstream.title = config.title;
    upstream.transport.timeout = config.upstreamTimeout;
    upstream.transport.maxRetries = config.upstreamRetries;
    upstream.transport.baseBackoff = config.upstreamBackoff;

    std::shared_ptr<infrastructure::OpenRouterClient> llm;
    try {
        llm = std::make_shared<infrastructure::OpenRouterClient>(upstream);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[DocGen] Configuration error: " << e.what() << std::endl;
        store->stopJanitor();
        return 1;
    }

    application::DocumentOrchestrator::Options orchestratorOptions;
    orchestratorOptions.defaultModel = config.defaultModel;
    application::DocumentOrchestrator orchestrator(llm, orchestratorOptions);
    application::ExportService exporter(*store);
    app::DocGenServer server(orchestrator, exporter, config.routePrefix);

    if (!server.bind(config.host, config.port)) {
        std::cerr << "[DocGen] Cannot bind " << config.host << ":" << config.port << std::endl;
        store->stopJanitor();
        return 1;
    }

    std::thread signalWaiter([&server, signals]() {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            std::cout << "[DocGen] Received signal " << received << ", shutting down..." << std::endl;
            server.stop();
        }
    });
    signalWaiter.detach();

    std::cout << "[DocGen] Listening on " << config.host << ":" << config.port
              << " (routes under " << config.routePrefix << ", artifacts in " << config.artifactDir << ")" << std::endl;

    bool clean = server.listenAfterBind();
    store->stopJanitor();
    std::cout << "[DocGen] Stopped." << std::endl;
    return clean ? 0 : 1;
}
