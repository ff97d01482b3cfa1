/**
 * @file JsonMapping.hpp
 * @brief Conversions between domain types and their JSON wire form.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/ChatCompletion.hpp"
#include "domain/Document.hpp"

namespace docgen::infrastructure {

class JsonMapping {
public:
    /** @brief Provider request body; response_format is omitted when unset. */
    static nlohmann::json ToJson(const domain::ChatRequest& request);

    /** @brief Parses a provider response. Throws on shape mismatch. */
    static domain::ChatResponse ParseChatResponse(const nlohmann::json& body);

    static nlohmann::json ToJson(const domain::Diagram& diagram);

    /** @brief Present sections plus a "diagrams" array (always emitted). */
    static nlohmann::json ToJson(const domain::FullDocument& document);

    /** @brief Lenient diagram parse used for diagrams embedded in LLM JSON content. */
    static domain::Diagram ParseDiagram(const nlohmann::json& value);

    /** @throws domain::InvalidRequest when fields have the wrong type. */
    static domain::DocGenRequest ParseDocGenRequest(const nlohmann::json& body);

    /** @brief Reads the "prompts" list on top of the common request fields. */
    static domain::FullRequest ParseFullRequest(const nlohmann::json& body);

    /**
     * @brief Parses LLM content as a JSON object, tolerating a ```json fence around it.
     * @return nullopt when the content is not a JSON object.
     */
    static std::optional<nlohmann::json> ExtractJsonObject(const std::string& content);
};

} // namespace docgen::infrastructure
