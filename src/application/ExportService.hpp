/**
 * @file ExportService.hpp
 * @brief Renders markdown bundles into downloadable files held by the ArtifactStore.
 */

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "infrastructure/ArtifactStore.hpp"

namespace docgen::application {

enum class ExportFormat {
    Pdf,      ///< One <section>.pdf per section
    Archive,  ///< A single bundle.tar holding one <section>.md per section
    Markdown  ///< One <section>.md per section
};

struct ExportResult {
    std::string artifactId;
    std::vector<std::string> filenames;
};

class ExportService {
public:
    static constexpr const char* kArchiveFilename = "bundle.tar";

    explicit ExportService(infrastructure::ArtifactStore& store);

    /**
     * @brief Accepts "pdf", "archive"/"tar" and "markdown"/"md"/"zip".
     * @throws domain::InvalidRequest for anything else.
     */
    static ExportFormat ParseFormat(const std::string& format);

    /** @brief Reduces a section key to a filename stem of [A-Za-z0-9_-]. */
    static std::string SanitizeKey(const std::string& key);

    /**
     * @brief Renders @p bundle (section key -> markdown) into a new artifact.
     *
     * If any write fails the artifact directory is removed before the error propagates.
     * @throws domain::InvalidRequest for an empty bundle.
     */
    ExportResult exportBundle(const std::map<std::string, std::string>& bundle, ExportFormat format);

    /** @throws domain::ArtifactNotFound when expired or never created. */
    std::filesystem::path resolveFile(const std::string& artifactId, const std::string& filename) const;

private:
    std::vector<std::pair<std::string, std::string>> renderFiles(const std::map<std::string, std::string>& bundle,
                                                                 ExportFormat format) const;

    infrastructure::ArtifactStore& m_store;
};

} // namespace docgen::application
