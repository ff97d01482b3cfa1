/**
 * @file DocumentOrchestrator.hpp
 * @brief Composes prompts, fans out upstream calls and assembles multi-section documents.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "domain/ChatCompletion.hpp"
#include "domain/Document.hpp"
#include "domain/Section.hpp"
#include "infrastructure/CancellationToken.hpp"

namespace docgen::application {

/**
 * @class DocumentOrchestrator
 * @brief Turns generation requests into upstream calls and merges the answers.
 *
 * Structured sections of a request share one JSON-mode call; each diagram-only
 * section gets a dedicated call whose content is kept verbatim. Sections the
 * upstream leaves out stay absent in the result.
 */
class DocumentOrchestrator {
public:
    struct Options {
        std::string defaultModel = "openrouter/auto";
    };

    DocumentOrchestrator(std::shared_ptr<domain::ChatCompletionService> llm, Options options);

    /**
     * @brief Generates every requested section (default set when none are named).
     * @throws domain::InvalidRequest for unknown section ids.
     * @throws domain::UpstreamError when an upstream call fails or its content is not a JSON object.
     */
    domain::FullDocument generateFull(const domain::FullRequest& request,
                                      const infrastructure::CancellationToken* cancel = nullptr);

    /**
     * @brief Generates one section with its own call (summary, plan and design endpoints).
     *
     * A structured section that embeds diagrams also returns the "diagrams" array of its answer.
     */
    domain::FullDocument generateSection(const domain::DocGenRequest& request,
                                         const std::string& sectionId,
                                         const infrastructure::CancellationToken* cancel = nullptr);

    /** @brief Maps ids to catalogued sections, dropping duplicates and keeping first-seen order. */
    static std::vector<const domain::SectionSpec*> ResolveSections(const std::vector<std::string>& sectionIds);

private:
    domain::ChatRequest buildRequest(const domain::DocGenRequest& request,
                                     const std::string& instructions,
                                     bool jsonMode) const;

    std::string completeContent(const domain::ChatRequest& chatRequest,
                                const infrastructure::CancellationToken* cancel);

    void generateStructured(const domain::DocGenRequest& request,
                            const std::vector<const domain::SectionSpec*>& sections,
                            bool acceptEmbeddedDiagrams,
                            domain::FullDocument& document,
                            const infrastructure::CancellationToken* cancel);

    domain::Diagram generateDiagram(const domain::DocGenRequest& request,
                                    const domain::SectionSpec& section,
                                    const infrastructure::CancellationToken* cancel);

    std::shared_ptr<domain::ChatCompletionService> m_llm;
    Options m_options;
};

} // namespace docgen::application
