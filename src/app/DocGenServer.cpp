/**
 * @file DocGenServer.cpp
 * @brief Implementation of the DocGenServer class.
 */
#include "app/DocGenServer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <nlohmann/json.hpp>
#include <utility>

#include "domain/Errors.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace docgen::app {

using json = nlohmann::json;
using domain::UpstreamError;
using infrastructure::JsonMapping;

namespace {

constexpr const char* kJson = "application/json";

void WriteError(httplib::Response& res, int status, const std::string& kind,
                const std::string& message, int upstreamStatus = 0) {
    json body = {{"error", kind}, {"message", message}};
    if (upstreamStatus > 0) {
        body["upstream_status"] = upstreamStatus;
    }
    res.status = status;
    res.set_content(body.dump(), kJson);
}

void WriteUpstreamError(httplib::Response& res, const UpstreamError& e) {
    switch (e.kind()) {
        case UpstreamError::Kind::Unauthorized:
            WriteError(res, 502, "upstream_unauthorized", e.what(), e.status());
            return;
        case UpstreamError::Kind::Forbidden:
            WriteError(res, 502, "upstream_forbidden", e.what(), e.status());
            return;
        case UpstreamError::Kind::RateLimited:
            WriteError(res, 429, "rate_limited", e.what(), e.status());
            return;
        case UpstreamError::Kind::Transport:
            WriteError(res, 502, "upstream_unavailable", e.what());
            return;
        case UpstreamError::Kind::Cancelled:
            WriteError(res, 503, "cancelled", e.what());
            return;
        case UpstreamError::Kind::Parse:
        case UpstreamError::Kind::EmptyResponse:
            WriteError(res, 502, "upstream_parse_error", e.what(), e.status());
            return;
        case UpstreamError::Kind::ServerError:
        case UpstreamError::Kind::Status:
            WriteError(res, 502, "upstream_error", e.what(), e.status());
            return;
    }
    WriteError(res, 502, "upstream_error", e.what(), e.status());
}

/** @brief Runs a handler body and converts every failure into an error response. */
template <typename Fn>
void Guarded(const httplib::Request& req, httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const domain::InvalidRequest& e) {
        WriteError(res, 400, "invalid_request", e.what());
    } catch (const json::exception& e) {
        WriteError(res, 400, "invalid_request", std::string("invalid request body: ") + e.what());
    } catch (const domain::ArtifactNotFound& e) {
        std::cerr << "[DocGenServer] " << e.what() << std::endl;
        WriteError(res, 404, "not_found", e.what());
    } catch (const UpstreamError& e) {
        std::cerr << "[DocGenServer] " << req.method << " " << req.path << " upstream failure ("
                  << UpstreamError::KindToString(e.kind()) << "): " << e.what() << std::endl;
        WriteUpstreamError(res, e);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[DocGenServer] Storage failure: " << e.what() << std::endl;
        WriteError(res, 500, "storage_error", e.what());
    } catch (const std::exception& e) {
        std::cerr << "[DocGenServer] Unhandled error on " << req.path << ": " << e.what() << std::endl;
        WriteError(res, 500, "internal_error", e.what());
    }
}

json ParseBody(const httplib::Request& req) {
    if (req.body.empty()) {
        throw domain::InvalidRequest("request body is empty");
    }
    return json::parse(req.body);
}

std::string ContentTypeFor(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".md") return "text/markdown; charset=utf-8";
    if (ext == ".tar") return "application/x-tar";
    if (ext == ".json") return kJson;
    return "application/octet-stream";
}

} // namespace

DocGenServer::DocGenServer(application::DocumentOrchestrator& orchestrator,
                           application::ExportService& exporter,
                           std::string routePrefix)
    : m_orchestrator(orchestrator), m_exporter(exporter), m_prefix(std::move(routePrefix)) {
    while (!m_prefix.empty() && m_prefix.back() == '/') {
        m_prefix.pop_back();
    }
    registerRoutes();
}

void DocGenServer::registerRoutes() {
    m_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[DocGenServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });

    m_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", kJson);
    });

    m_server.Post(m_prefix + "/summary", [this](const httplib::Request& req, httplib::Response& res) {
        handleSingleSection(req, res, "exec_summary", "summary_md");
    });
    m_server.Post(m_prefix + "/plan", [this](const httplib::Request& req, httplib::Response& res) {
        handleSingleSection(req, res, "solution_plan", "plan_md");
    });
    m_server.Post(m_prefix + "/design", [this](const httplib::Request& req, httplib::Response& res) {
        handleDesign(req, res);
    });
    m_server.Post(m_prefix + "/full", [this](const httplib::Request& req, httplib::Response& res) {
        handleFull(req, res);
    });
    m_server.Post(m_prefix + "/export", [this](const httplib::Request& req, httplib::Response& res) {
        handleExport(req, res);
    });
    m_server.Get(m_prefix + R"(/files/([^/]+)/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleFile(req, res);
    });
}

void DocGenServer::handleSingleSection(const httplib::Request& req, httplib::Response& res,
                                       const std::string& sectionId, const std::string& outputKey) {
    Guarded(req, res, [&]() {
        auto request = JsonMapping::ParseDocGenRequest(ParseBody(req));
        auto document = m_orchestrator.generateSection(request, sectionId, &m_shutdown);
        json body = {{outputKey, document.section(outputKey).value_or("")}};
        res.set_content(body.dump(), kJson);
    });
}

void DocGenServer::handleDesign(const httplib::Request& req, httplib::Response& res) {
    Guarded(req, res, [&]() {
        auto request = JsonMapping::ParseDocGenRequest(ParseBody(req));
        auto document = m_orchestrator.generateSection(request, "architecture_overview", &m_shutdown);
        json diagrams = json::array();
        for (const auto& diagram : document.diagrams) {
            diagrams.push_back(JsonMapping::ToJson(diagram));
        }
        json body = {
            {"design_md", document.section("design_md").value_or("")},
            {"diagrams", diagrams}
        };
        res.set_content(body.dump(), kJson);
    });
}

void DocGenServer::handleFull(const httplib::Request& req, httplib::Response& res) {
    Guarded(req, res, [&]() {
        auto request = JsonMapping::ParseFullRequest(ParseBody(req));
        auto document = m_orchestrator.generateFull(request, &m_shutdown);
        res.set_content(JsonMapping::ToJson(document).dump(), kJson);
    });
}

void DocGenServer::handleExport(const httplib::Request& req, httplib::Response& res) {
    Guarded(req, res, [&]() {
        json body = ParseBody(req);
        if (!body.is_object() || !body.contains("bundle") || !body["bundle"].is_object()) {
            throw domain::InvalidRequest("'bundle' must be an object of section -> markdown");
        }
        if (!body.contains("format") || !body["format"].is_string()) {
            throw domain::InvalidRequest("'format' must be a string");
        }

        std::map<std::string, std::string> bundle;
        for (const auto& [key, value] : body["bundle"].items()) {
            if (value.is_string()) {
                bundle[key] = value.get<std::string>();
            }
        }

        auto format = application::ExportService::ParseFormat(body["format"].get<std::string>());
        auto result = m_exporter.exportBundle(bundle, format);
        json out = {
            {"artifact_id", result.artifactId},
            {"filenames", result.filenames}
        };
        res.set_content(out.dump(), kJson);
    });
}

void DocGenServer::handleFile(const httplib::Request& req, httplib::Response& res) {
    Guarded(req, res, [&]() {
        std::string id = req.matches[1];
        std::string filename = req.matches[2];
        auto path = m_exporter.resolveFile(id, filename);

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            // Reclaimed between resolution and read.
            throw domain::ArtifactNotFound(id, filename);
        }
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        res.set_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");
        res.set_content(data, ContentTypeFor(path));
    });
}

bool DocGenServer::bind(const std::string& host, int port) {
    return m_server.bind_to_port(host, port);
}

int DocGenServer::bindToAnyPort(const std::string& host) {
    return m_server.bind_to_any_port(host);
}

bool DocGenServer::listenAfterBind() {
    return m_server.listen_after_bind();
}

void DocGenServer::stop() {
    m_shutdown.cancel();
    m_server.stop();
}

} // namespace docgen::app
