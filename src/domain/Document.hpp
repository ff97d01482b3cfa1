/**
 * @file Document.hpp
 * @brief Generation requests and the assembled multi-section document.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docgen::domain {

/**
 * @struct DocGenRequest
 * @brief Problem statement every generation endpoint receives.
 */
struct DocGenRequest {
    std::string title;
    std::string description;
    std::vector<std::string> constraints;
    std::optional<std::string> model; ///< Overrides the configured default model.
};

/** @brief Request for several sections at once. Empty list selects the default set. */
struct FullRequest {
    DocGenRequest base;
    std::vector<std::string> sections;
};

/**
 * @struct Diagram
 * @brief Diagram source plus classification metadata. The code is never parsed.
 */
struct Diagram {
    std::string id;
    std::string type;
    std::string language;
    std::optional<std::string> title;
    std::string code;
    std::string section; ///< Id of the section that produced this diagram.
};

/**
 * @struct FullDocument
 * @brief Markdown sections keyed by output key, plus diagrams.
 *
 * Every section is optional; a missing key means the upstream did not produce it.
 */
struct FullDocument {
    std::map<std::string, std::string> sections;
    std::vector<Diagram> diagrams;

    std::optional<std::string> section(const std::string& key) const {
        auto it = sections.find(key);
        if (it == sections.end()) return std::nullopt;
        return it->second;
    }
};

} // namespace docgen::domain
