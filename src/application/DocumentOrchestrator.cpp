/**
 * @file DocumentOrchestrator.cpp
 * @brief Implementation of DocumentOrchestrator.
 */

#include "application/DocumentOrchestrator.hpp"

#include <future>
#include <iostream>
#include <unordered_set>
#include <utility>
#include <variant>

#include "domain/Errors.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace docgen::application {

using domain::UpstreamError;
using infrastructure::JsonMapping;
using infrastructure::PromptCatalog;

DocumentOrchestrator::DocumentOrchestrator(std::shared_ptr<domain::ChatCompletionService> llm, Options options)
    : m_llm(std::move(llm)), m_options(std::move(options)) {}

std::vector<const domain::SectionSpec*> DocumentOrchestrator::ResolveSections(const std::vector<std::string>& sectionIds) {
    const auto& ids = sectionIds.empty() ? PromptCatalog::DefaultFullSections() : sectionIds;

    std::vector<const domain::SectionSpec*> resolved;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) continue;
        const auto* spec = PromptCatalog::Find(id);
        if (!spec) {
            throw domain::InvalidRequest("unknown section '" + id + "'");
        }
        resolved.push_back(spec);
    }
    return resolved;
}

domain::ChatRequest DocumentOrchestrator::buildRequest(const domain::DocGenRequest& request,
                                                       const std::string& instructions,
                                                       bool jsonMode) const {
    domain::ChatRequest chat;
    chat.model = request.model.value_or(m_options.defaultModel);
    chat.messages = {
        {domain::ChatMessage::Role::System, PromptCatalog::GetSystemPrompt()},
        {domain::ChatMessage::Role::User, PromptCatalog::ComposeUserPrompt(instructions, request)}
    };
    if (jsonMode) {
        chat.responseFormat = "json_object";
    }
    return chat;
}

std::string DocumentOrchestrator::completeContent(const domain::ChatRequest& chatRequest,
                                                  const infrastructure::CancellationToken* cancel) {
    auto response = m_llm->createChatCompletion(chatRequest, cancel);
    if (response.choices.empty()) {
        std::cerr << "[DocumentOrchestrator] No choices returned from upstream (id=" << response.id << ")" << std::endl;
        throw UpstreamError(UpstreamError::Kind::EmptyResponse, "no choices returned from upstream");
    }
    return response.choices.front().message.content;
}

void DocumentOrchestrator::generateStructured(const domain::DocGenRequest& request,
                                              const std::vector<const domain::SectionSpec*>& sections,
                                              bool acceptEmbeddedDiagrams,
                                              domain::FullDocument& document,
                                              const infrastructure::CancellationToken* cancel) {
    std::string instructions = PromptCatalog::ComposeStructuredInstructions(sections, acceptEmbeddedDiagrams);
    std::string content = completeContent(buildRequest(request, instructions, true), cancel);

    auto parsed = JsonMapping::ExtractJsonObject(content);
    if (!parsed) {
        std::cerr << "[DocumentOrchestrator] Content is not a JSON object: " << content << std::endl;
        throw UpstreamError(UpstreamError::Kind::Parse, "failed to parse LLM response as a JSON object", 0, content);
    }

    for (const auto* section : sections) {
        const auto* out = std::get_if<domain::StructuredOutput>(&section->shape);
        if (!out) continue;

        auto it = parsed->find(out->outputKey);
        if (it == parsed->end()) {
            std::cout << "[DocumentOrchestrator] Section " << section->id << " missing from response" << std::endl;
            continue;
        }
        if (!it->is_string()) {
            std::cerr << "[DocumentOrchestrator] Ignoring non-string value for " << out->outputKey << std::endl;
            continue;
        }
        document.sections[out->outputKey] = it->get<std::string>();
    }

    if (acceptEmbeddedDiagrams) {
        auto diagrams = parsed->find("diagrams");
        if (diagrams != parsed->end() && diagrams->is_array()) {
            for (const auto& item : *diagrams) {
                if (item.is_object()) {
                    document.diagrams.push_back(JsonMapping::ParseDiagram(item));
                }
            }
        }
    }
}

domain::Diagram DocumentOrchestrator::generateDiagram(const domain::DocGenRequest& request,
                                                      const domain::SectionSpec& section,
                                                      const infrastructure::CancellationToken* cancel) {
    const auto& out = std::get<domain::DiagramOutput>(section.shape);

    domain::Diagram diagram;
    diagram.code = completeContent(buildRequest(request, PromptCatalog::ComposeDiagramInstructions(section), false),
                                   cancel);
    diagram.id = infrastructure::IdGenerator::NewUuid();
    diagram.type = out.diagramType;
    diagram.language = out.language;
    if (!out.title.empty()) {
        diagram.title = out.title;
    }
    diagram.section = section.id;
    return diagram;
}

domain::FullDocument DocumentOrchestrator::generateFull(const domain::FullRequest& request,
                                                        const infrastructure::CancellationToken* cancel) {
    auto sections = ResolveSections(request.sections);

    std::vector<const domain::SectionSpec*> structured;
    std::vector<const domain::SectionSpec*> diagramSections;
    for (const auto* section : sections) {
        if (section->isDiagram()) {
            diagramSections.push_back(section);
        } else {
            structured.push_back(section);
        }
    }

    std::cout << "[DocumentOrchestrator] Full request: " << structured.size() << " structured section(s), "
              << diagramSections.size() << " diagram(s)" << std::endl;

    std::vector<std::future<domain::Diagram>> pending;
    pending.reserve(diagramSections.size());
    for (const auto* section : diagramSections) {
        pending.push_back(std::async(std::launch::async, [this, &request, section, cancel]() {
            return generateDiagram(request.base, *section, cancel);
        }));
    }

    domain::FullDocument document;
    if (!structured.empty()) {
        generateStructured(request.base, structured, false, document, cancel);
    }

    for (auto& future : pending) {
        document.diagrams.push_back(future.get());
    }
    return document;
}

domain::FullDocument DocumentOrchestrator::generateSection(const domain::DocGenRequest& request,
                                                           const std::string& sectionId,
                                                           const infrastructure::CancellationToken* cancel) {
    const auto* section = PromptCatalog::Find(sectionId);
    if (!section) {
        throw domain::InvalidRequest("unknown section '" + sectionId + "'");
    }

    domain::FullDocument document;
    if (section->isDiagram()) {
        document.diagrams.push_back(generateDiagram(request, *section, cancel));
        return document;
    }

    bool embeds = std::get<domain::StructuredOutput>(section->shape).embedsDiagrams;
    generateStructured(request, {section}, embeds, document, cancel);
    return document;
}

} // namespace docgen::application
