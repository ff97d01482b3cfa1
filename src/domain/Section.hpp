/**
 * @file Section.hpp
 * @brief Requestable document sections and the shape of output each one yields.
 */

#pragma once
#include <string>
#include <variant>

namespace docgen::domain {

/** @brief Section answered as a key inside a JSON object of markdown strings. */
struct StructuredOutput {
    std::string outputKey;        ///< e.g. "summary_md"
    bool embedsDiagrams = false;  ///< Standalone answers may also carry a "diagrams" array.
};

/** @brief Section answered with raw diagram markup and nothing else. */
struct DiagramOutput {
    std::string diagramType; ///< e.g. "component"
    std::string language;    ///< e.g. "mermaid"
    std::string title;
};

using SectionShape = std::variant<StructuredOutput, DiagramOutput>;

/**
 * @struct SectionSpec
 * @brief A catalogued section: its id, prompt template and output shape.
 */
struct SectionSpec {
    std::string id;
    std::string templateText;
    SectionShape shape;

    bool isDiagram() const { return std::holds_alternative<DiagramOutput>(shape); }
};

} // namespace docgen::domain
