/**
 * @file JsonMapping.cpp
 * @brief Implementation of JsonMapping.
 */
#include "infrastructure/JsonMapping.hpp"

#include "domain/Errors.hpp"

#include <stdexcept>

namespace docgen::infrastructure {

using json = nlohmann::json;

namespace {

std::string StringField(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return {};
    if (!body[key].is_string()) {
        throw domain::InvalidRequest(std::string("field '") + key + "' must be a string");
    }
    return body[key].get<std::string>();
}

std::vector<std::string> StringList(const json& body, const char* key) {
    std::vector<std::string> out;
    if (!body.contains(key) || body[key].is_null()) return out;
    const auto& value = body[key];
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
        return out;
    }
    if (!value.is_array()) {
        throw domain::InvalidRequest(std::string("field '") + key + "' must be a list of strings");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw domain::InvalidRequest(std::string("field '") + key + "' must be a list of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// LLM content is loosely typed; stringify whatever is there.
std::string LooseString(const json& value, const char* key) {
    if (!value.contains(key) || value[key].is_null()) return {};
    if (value[key].is_string()) return value[key].get<std::string>();
    return value[key].dump();
}

} // namespace

json JsonMapping::ToJson(const domain::ChatRequest& request) {
    json messages = json::array();
    for (const auto& msg : request.messages) {
        messages.push_back({
            {"role", domain::ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    json body = {
        {"model", request.model},
        {"messages", messages}
    };
    if (request.responseFormat && !request.responseFormat->empty()) {
        body["response_format"] = {{"type", *request.responseFormat}};
    }
    return body;
}

domain::ChatResponse JsonMapping::ParseChatResponse(const json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("chat response must be a JSON object");
    }

    domain::ChatResponse response;
    response.id = body.value("id", "");

    if (body.contains("choices") && !body["choices"].is_null()) {
        if (!body["choices"].is_array()) {
            throw std::invalid_argument("chat response 'choices' must be an array");
        }
        for (const auto& choice : body.at("choices")) {
            domain::ChatChoice parsed;
            if (choice.contains("message") && choice["message"].is_object()) {
                const auto& message = choice["message"];
                parsed.message.role = domain::ChatMessage::RoleFromString(message.value("role", "assistant"));
                if (message.contains("content") && !message["content"].is_null()) {
                    parsed.message.content = message["content"].get<std::string>();
                }
            }
            response.choices.push_back(std::move(parsed));
        }
    }

    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        response.usage.promptTokens = usage.value("prompt_tokens", 0);
        response.usage.completionTokens = usage.value("completion_tokens", 0);
        response.usage.totalTokens = usage.value("total_tokens", 0);
    }
    return response;
}

json JsonMapping::ToJson(const domain::Diagram& diagram) {
    json out = {
        {"id", diagram.id},
        {"type", diagram.type},
        {"language", diagram.language},
        {"code", diagram.code}
    };
    if (diagram.title && !diagram.title->empty()) {
        out["title"] = *diagram.title;
    }
    if (!diagram.section.empty()) {
        out["section"] = diagram.section;
    }
    return out;
}

json JsonMapping::ToJson(const domain::FullDocument& document) {
    json out = json::object();
    for (const auto& [key, markdown] : document.sections) {
        out[key] = markdown;
    }
    json diagrams = json::array();
    for (const auto& diagram : document.diagrams) {
        diagrams.push_back(ToJson(diagram));
    }
    out["diagrams"] = diagrams;
    return out;
}

domain::Diagram JsonMapping::ParseDiagram(const json& value) {
    domain::Diagram diagram;
    diagram.id = LooseString(value, "id");
    diagram.type = LooseString(value, "type");
    diagram.language = LooseString(value, "language");
    diagram.code = LooseString(value, "code");
    if (value.contains("title") && value["title"].is_string()) {
        diagram.title = value["title"].get<std::string>();
    }
    return diagram;
}

domain::DocGenRequest JsonMapping::ParseDocGenRequest(const json& body) {
    if (!body.is_object()) {
        throw domain::InvalidRequest("request body must be a JSON object");
    }
    domain::DocGenRequest request;
    request.title = StringField(body, "title");
    request.description = StringField(body, "description");
    request.constraints = StringList(body, "constraints");
    std::string model = StringField(body, "model");
    if (!model.empty()) {
        request.model = model;
    }
    return request;
}

domain::FullRequest JsonMapping::ParseFullRequest(const json& body) {
    domain::FullRequest request;
    request.base = ParseDocGenRequest(body);
    request.sections = StringList(body, "prompts");
    return request;
}

std::optional<json> JsonMapping::ExtractJsonObject(const std::string& content) {
    json parsed = json::parse(content, nullptr, false);
    if (!parsed.is_discarded()) {
        if (parsed.is_object()) return parsed;
        return std::nullopt;
    }

    // Only a fence that wraps the whole answer is stripped; fences inside values stay intact.
    auto first = content.find_first_not_of(" \t\r\n");
    auto last = content.find_last_not_of(" \t\r\n");
    if (first == std::string::npos || content.compare(first, 3, "```") != 0) {
        return std::nullopt;
    }
    auto bodyStart = content.find('\n', first);
    if (bodyStart == std::string::npos || last < 3 || content.compare(last - 2, 3, "```") != 0 ||
        last - 2 <= bodyStart) {
        return std::nullopt;
    }

    parsed = json::parse(content.substr(bodyStart + 1, last - 2 - bodyStart - 1), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace docgen::infrastructure
