/**
 * @file DocGenServer.hpp
 * @brief HTTP surface of the document-generation service.
 */

#pragma once

#include <string>
#include <httplib.h>

#include "application/DocumentOrchestrator.hpp"
#include "application/ExportService.hpp"
#include "infrastructure/CancellationToken.hpp"

namespace docgen::app {

/**
 * @class DocGenServer
 * @brief Routes HTTP requests to the orchestrator and export service.
 *
 * Generation, export and file routes live under a prefix (default /v1/docgen);
 * /health is always at the root. Errors are answered as
 * {"error": kind, "message": text} with a status per error class.
 */
class DocGenServer {
public:
    DocGenServer(application::DocumentOrchestrator& orchestrator,
                 application::ExportService& exporter,
                 std::string routePrefix = "/v1/docgen");

    DocGenServer(const DocGenServer&) = delete;
    DocGenServer& operator=(const DocGenServer&) = delete;

    /** @brief Binds to @p host:@p port. */
    bool bind(const std::string& host, int port);

    /** @brief Binds to a free port; returns it, or -1 on failure. */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves until stop() is called. Blocks the calling thread. */
    bool listenAfterBind();

    /** @brief Cancels pending upstream retries and stops accepting requests. */
    void stop();

    bool isRunning() const { return m_server.is_running(); }

    void waitUntilReady() const { m_server.wait_until_ready(); }

private:
    void registerRoutes();
    void handleSingleSection(const httplib::Request& req, httplib::Response& res,
                             const std::string& sectionId, const std::string& outputKey);
    void handleDesign(const httplib::Request& req, httplib::Response& res);
    void handleFull(const httplib::Request& req, httplib::Response& res);
    void handleExport(const httplib::Request& req, httplib::Response& res);
    void handleFile(const httplib::Request& req, httplib::Response& res);

    application::DocumentOrchestrator& m_orchestrator;
    application::ExportService& m_exporter;
    std::string m_prefix;
    httplib::Server m_server;
    infrastructure::CancellationToken m_shutdown;
};

} // namespace docgen::app
