/**
 * @file PromptAssembler.hpp
 * @brief Builds language model prompts from percepts, memories and the action manifest.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/AIService.hpp"
#include "domain/Entities.hpp"
#include "domain/MemoryRepository.hpp"

namespace psyche::application {

/**
 * @struct PromptBundle
 * @brief Structured context blocks for one model call.
 */
struct PromptBundle {
    std::string identity;
    std::string instruction;
    std::vector<domain::Percept> items;
    std::vector<domain::RecallHit> memories;
    std::string situation;
    std::string manifest;

    /** @brief Template variables: identity, items, memories, situation, motors. */
    std::map<std::string, std::string> variables() const;

    /**
     * @brief Renders the bundle as "=== SECTION ===" blocks.
     * Used when the instruction carries no placeholders.
     */
    std::string render() const;
};

/**
 * @class PromptAssembler
 * @brief Stateless prompt rendering shared by the Distillers and the Will.
 */
class PromptAssembler {
public:
    using ChatMessage = domain::AIService::ChatMessage;

    /** @brief Replaces every `{{key}}`. Unknown placeholders are left in place. */
    static std::string RenderTemplate(const std::string& tmpl, const std::map<std::string, std::string>& vars);

    static bool HasPlaceholders(const std::string& text);

    /** @brief "Relevant memories:" section, or an empty string when there are none. */
    static std::string FormatMemories(const std::vector<domain::RecallHit>& memories);

    /** @brief One "- [label] text" line per percept, labelled by the last segment of its kind. */
    static std::string FormatItems(const std::vector<domain::Percept>& items);

    /**
     * @brief System message with identity and instruction, user message with the window.
     * An instruction with placeholders is rendered in place instead and sent alone.
     */
    static std::vector<ChatMessage> BuildDistillation(const PromptBundle& bundle);

    /** @brief Single user message for the Will. */
    static std::vector<ChatMessage> BuildDecision(const PromptBundle& bundle);
};

} // namespace psyche::application
