/**
 * @file ExportService.cpp
 * @brief Implementation of ExportService.
 */

#include "application/ExportService.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <utility>

#include "domain/Errors.hpp"
#include "infrastructure/PdfWriter.hpp"
#include "infrastructure/TarWriter.hpp"

namespace docgen::application {

namespace {

// Leaves room for a "_N" suffix and the extension inside a 99-byte tar name.
constexpr std::size_t kMaxStemLength = 90;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

ExportService::ExportService(infrastructure::ArtifactStore& store)
    : m_store(store) {}

ExportFormat ExportService::ParseFormat(const std::string& format) {
    std::string token = ToLower(format);
    if (token == "pdf") return ExportFormat::Pdf;
    if (token == "archive" || token == "tar") return ExportFormat::Archive;
    if (token == "markdown" || token == "md" || token == "zip") return ExportFormat::Markdown;
    throw domain::InvalidRequest("unsupported export format '" + format + "'");
}

std::string ExportService::SanitizeKey(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char ch : key) {
        unsigned char c = static_cast<unsigned char>(ch);
        out.push_back(std::isalnum(c) || ch == '_' || ch == '-' ? ch : '_');
    }
    return out.empty() ? "section" : out;
}

std::vector<std::pair<std::string, std::string>> ExportService::renderFiles(
    const std::map<std::string, std::string>& bundle, ExportFormat format) const {
    const char* extension = format == ExportFormat::Pdf ? ".pdf" : ".md";

    std::vector<std::pair<std::string, std::string>> files;
    std::set<std::string> used;
    for (const auto& [key, markdown] : bundle) {
        std::string stem = SanitizeKey(key);
        if (stem.size() > kMaxStemLength) {
            stem.resize(kMaxStemLength);
        }
        std::string name = stem + extension;
        for (int n = 2; used.count(name); ++n) {
            name = stem + "_" + std::to_string(n) + extension;
        }
        used.insert(name);

        if (format == ExportFormat::Pdf) {
            files.emplace_back(name, infrastructure::PdfWriter::RenderMarkdown(markdown));
        } else {
            files.emplace_back(name, markdown);
        }
    }

    if (format == ExportFormat::Archive) {
        infrastructure::TarWriter tar;
        for (const auto& [name, data] : files) {
            tar.addFile(name, data);
        }
        return {{kArchiveFilename, tar.finish()}};
    }
    return files;
}

ExportResult ExportService::exportBundle(const std::map<std::string, std::string>& bundle, ExportFormat format) {
    if (bundle.empty()) {
        throw domain::InvalidRequest("export bundle has no sections");
    }

    auto files = renderFiles(bundle, format);
    auto artifact = m_store.createNew();

    ExportResult result;
    result.artifactId = artifact.id;
    try {
        for (const auto& [name, data] : files) {
            m_store.writeFile(artifact, name, data);
            result.filenames.push_back(name);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ExportService] Export " << artifact.id << " failed: " << e.what() << std::endl;
        m_store.remove(artifact);
        throw;
    }

    std::cout << "[ExportService] Exported " << result.filenames.size() << " file(s) to artifact "
              << artifact.id << std::endl;
    return result;
}

std::filesystem::path ExportService::resolveFile(const std::string& artifactId, const std::string& filename) const {
    return m_store.getArtifactPath(artifactId, filename);
}

} // namespace docgen::application
