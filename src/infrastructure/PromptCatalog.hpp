/**
 * @file PromptCatalog.hpp
 * @brief Central storage for section prompt templates and their output shapes.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Document.hpp"
#include "domain/Section.hpp"

namespace docgen::infrastructure {

class PromptCatalog {
public:
    /** @brief Returns the catalogued section, or nullptr for an unknown id. */
    static const domain::SectionSpec* Find(const std::string& sectionId);

    /** @brief All catalogued sections in display order. */
    static const std::vector<domain::SectionSpec>& All();

    /** @brief Section ids used by a full request that names none. */
    static const std::vector<std::string>& DefaultFullSections();

    /** @brief System message sent with every generation call. */
    static std::string GetSystemPrompt();

    /** @brief Appends the problem statement (title, description, constraints) to @p instructions. */
    static std::string ComposeUserPrompt(const std::string& instructions, const domain::DocGenRequest& request);

    /**
     * @brief Instructions for the single batched call covering several structured sections.
     * @param sections Structured sections only.
     * @param withEmbeddedDiagrams Also ask for a "diagrams" array (standalone design requests).
     */
    static std::string ComposeStructuredInstructions(const std::vector<const domain::SectionSpec*>& sections,
                                                     bool withEmbeddedDiagrams = false);

    /** @brief Instructions for a dedicated diagram-only call. */
    static std::string ComposeDiagramInstructions(const domain::SectionSpec& section);
};

} // namespace docgen::infrastructure
