/**
 * @file ChatCompletion.hpp
 * @brief Chat-completion request/response model and the upstream service interface.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace docgen::infrastructure {
class CancellationToken;
}

namespace docgen::domain {

/**
 * @struct ChatMessage
 * @brief Represents a single message in a chat conversation.
 */
struct ChatMessage {
    enum class Role { System, User, Assistant };
    Role role = Role::User;
    std::string content;

    static std::string RoleToString(Role r) {
        switch (r) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
        }
        return "user";
    }

    static Role RoleFromString(const std::string& value) {
        if (value == "system") return Role::System;
        if (value == "assistant") return Role::Assistant;
        return Role::User;
    }
};

struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<std::string> responseFormat; ///< e.g. "json_object"; omitted when empty.
};

struct ChatChoice {
    ChatMessage message;
};

struct TokenUsage {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
};

struct ChatResponse {
    std::string id;
    std::vector<ChatChoice> choices;
    TokenUsage usage;
};

/**
 * @class ChatCompletionService
 * @brief Abstract interface for an upstream provider of chat completions.
 */
class ChatCompletionService {
public:
    virtual ~ChatCompletionService() = default;

    /**
     * @brief Executes one chat-completion round trip.
     * @param request Model, ordered messages and optional response-format hint.
     * @param cancel Optional token that aborts pending retries.
     * @return The parsed provider response.
     * @throws UpstreamError on any upstream failure.
     */
    virtual ChatResponse createChatCompletion(const ChatRequest& request,
                                              const infrastructure::CancellationToken* cancel = nullptr) = 0;
};

} // namespace docgen::domain
