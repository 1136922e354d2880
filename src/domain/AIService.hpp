/**
 * @file AIService.hpp
 * @brief Interface for the language model backing distillation and decisions.
 */

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace psyche::domain {

/**
 * @class AIService
 * @brief Abstract interface over a chat-style language model with streaming output.
 */
class AIService {
public:
    virtual ~AIService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @struct ChatMessage
     * @brief Represents a single message in a chat conversation.
     */
    struct ChatMessage {
        enum class Role { System, User, Assistant };
        Role role;
        std::string content;

        static std::string RoleToString(Role r) {
            switch(r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
            }
            return "user";
        }
    };

    /** Receives each streamed token. Returning false aborts the stream. */
    using TokenCallback = std::function<bool(const std::string&)>;

    /**
     * @brief Streams the assistant's reply token by token.
     * @param history The conversation so far.
     * @param onToken Called for every token, in order.
     * @return true if the stream ran to completion; false on connection, HTTP
     *         or protocol errors and when onToken aborted it.
     */
    virtual bool streamChat(const std::vector<ChatMessage>& history, const TokenCallback& onToken) = 0;

    /**
     * @brief Convenience wrapper collecting the full reply.
     * @return The assistant's response content, or nullopt if the stream failed.
     */
    virtual std::optional<std::string> chat(const std::vector<ChatMessage>& history) {
        std::string reply;
        bool ok = streamChat(history, [&reply](const std::string& token) {
            reply += token;
            return true;
        });
        if (!ok) return std::nullopt;
        return reply;
    }

    /**
     * @brief Generates an embedding vector for semantic recall.
     * @return Empty vector if embeddings are unavailable.
     */
    virtual std::vector<float> getEmbedding(const std::string& text) = 0;

    /** @brief Returns the currently used model name. */
    virtual std::string getCurrentModel() const { return ""; }
};

} // namespace psyche::domain
