#include "infrastructure/PromptCatalog.hpp"

#include <sstream>
#include <variant>

namespace docgen::infrastructure {

using domain::DiagramOutput;
using domain::SectionSpec;
using domain::StructuredOutput;

namespace {

SectionSpec Structured(const char* id, const char* key, const char* text, bool embedsDiagrams = false) {
    return SectionSpec{id, text, StructuredOutput{key, embedsDiagrams}};
}

SectionSpec DiagramSection(const char* id, const char* type, const char* title, const char* text) {
    return SectionSpec{id, text, DiagramOutput{type, "mermaid", title}};
}

std::vector<SectionSpec> BuildCatalog() {
    return {
        Structured("exec_summary", "summary_md",
            "Write an executive summary of the problem and the proposed direction. "
            "Cover the problem, who is affected, the recommended approach and the expected outcome "
            "in at most four short paragraphs of markdown."),
        Structured("solution_plan", "plan_md",
            "Write a solution plan in markdown: phases, milestones, deliverables per phase and the "
            "main dependencies between them. Use headings for phases and bullet lists for deliverables."),
        Structured("architecture_overview", "design_md",
            "Describe the system design in markdown: main components and their responsibilities, "
            "data flow between them, external integrations and the key technology choices.", true),
        Structured("breakdown", "breakdown_md",
            "Break the work down into epics and tasks in markdown. Give each task a one-line "
            "description and a rough size (S, M or L)."),
        Structured("tradeoffs", "tradeoffs_md",
            "List the significant design tradeoffs in markdown. For each, state the options considered, "
            "the choice made and what is given up."),
        Structured("data_model", "data_model_md",
            "Describe the data model in markdown: entities, their key attributes, relationships and "
            "where each entity is stored."),
        Structured("risks", "risks_md",
            "List the main delivery and technical risks in markdown as a table with columns "
            "Risk, Likelihood, Impact and Mitigation."),
        Structured("acceptance_criteria", "acceptance_md",
            "Write acceptance criteria in markdown using Given/When/Then bullets grouped by feature."),
        Structured("test_plan", "testing_md",
            "Write a test plan in markdown covering unit, integration, end-to-end and load testing, "
            "with the critical scenarios for each level."),
        Structured("api_design", "api_md",
            "Describe the public API in markdown: endpoints or operations, request and response "
            "shapes, error cases and authentication."),
        Structured("capacity_estimate", "capacity_md",
            "Estimate capacity in markdown: expected users, request rates, storage growth and the "
            "resulting sizing, showing the arithmetic."),
        DiagramSection("mermaid_component", "component", "Component diagram",
            "Produce a Mermaid flowchart (graph TD) of the system's components and their dependencies."),
        DiagramSection("mermaid_deployment", "deployment", "Deployment diagram",
            "Produce a Mermaid flowchart (graph LR) showing how the components are deployed: "
            "runtimes, hosts or services, data stores and network boundaries."),
        DiagramSection("mermaid_sequence", "sequence", "Sequence diagram",
            "Produce a Mermaid sequenceDiagram of the main user request flowing through the system."),
    };
}

} // namespace

const std::vector<SectionSpec>& PromptCatalog::All() {
    static const std::vector<SectionSpec> catalog = BuildCatalog();
    return catalog;
}

const SectionSpec* PromptCatalog::Find(const std::string& sectionId) {
    for (const auto& spec : All()) {
        if (spec.id == sectionId) return &spec;
    }
    return nullptr;
}

const std::vector<std::string>& PromptCatalog::DefaultFullSections() {
    static const std::vector<std::string> defaults = {
        "exec_summary",
        "solution_plan",
        "architecture_overview",
        "risks",
        "acceptance_criteria",
        "mermaid_component"
    };
    return defaults;
}

std::string PromptCatalog::GetSystemPrompt() {
    return "You are a helpful assistant that generates documents based on user input.";
}

std::string PromptCatalog::ComposeUserPrompt(const std::string& instructions, const domain::DocGenRequest& request) {
    std::stringstream ss;
    ss << instructions << "\n\n";
    ss << "Problem Title: " << request.title << "\n";
    ss << "Problem Description: " << request.description;
    if (!request.constraints.empty()) {
        ss << "\nConstraints:";
        for (const auto& constraint : request.constraints) {
            ss << "\n- " << constraint;
        }
    }
    return ss.str();
}

std::string PromptCatalog::ComposeStructuredInstructions(const std::vector<const SectionSpec*>& sections,
                                                         bool withEmbeddedDiagrams) {
    std::stringstream ss;
    ss << "Return ONLY a valid JSON object, with no text before or after it.\n"
       << "Each value must be a markdown string. Use exactly these keys:\n";
    for (const auto* section : sections) {
        if (const auto* out = std::get_if<StructuredOutput>(&section->shape)) {
            ss << "- \"" << out->outputKey << "\"\n";
        }
    }
    if (withEmbeddedDiagrams) {
        ss << "- \"diagrams\": an array of objects with keys \"id\", \"type\", \"language\" (\"mermaid\"), "
           << "\"title\" and \"code\"\n";
    }
    ss << "\n";
    for (const auto* section : sections) {
        if (const auto* out = std::get_if<StructuredOutput>(&section->shape)) {
            ss << "## " << out->outputKey << "\n" << section->templateText << "\n\n";
        }
    }
    return ss.str();
}

std::string PromptCatalog::ComposeDiagramInstructions(const SectionSpec& section) {
    std::string language = "mermaid";
    if (const auto* out = std::get_if<DiagramOutput>(&section.shape)) {
        language = out->language;
    }
    return section.templateText + "\n"
           "Return ONLY the raw " + language + " source. No code fences, no JSON, no explanation.";
}

} // namespace docgen::infrastructure
