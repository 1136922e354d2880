/**
 * @file PromptAssembler.cpp
 * @brief Implementation of the PromptAssembler.
 */

#include "application/PromptAssembler.hpp"
#include <sstream>

namespace psyche::application {

namespace {

std::string KindLabel(const std::string& kind) {
    auto slash = kind.rfind('/');
    if (slash == std::string::npos) return kind;
    return kind.substr(slash + 1);
}

} // namespace

std::map<std::string, std::string> PromptBundle::variables() const {
    return {
        {"identity", identity},
        {"items", PromptAssembler::FormatItems(items)},
        {"memories", PromptAssembler::FormatMemories(memories)},
        {"situation", situation},
        {"motors", manifest}
    };
}

std::string PromptBundle::render() const {
    std::stringstream ss;

    if (!situation.empty()) {
        ss << "=== SITUATION ===\n" << situation << "\n\n";
    }

    if (!items.empty()) {
        ss << "=== RECENT ===\n" << PromptAssembler::FormatItems(items) << "\n";
    }

    if (!memories.empty()) {
        ss << "=== MEMORIES ===\n" << PromptAssembler::FormatMemories(memories) << "\n";
    }

    if (!manifest.empty()) {
        ss << "=== ACTIONS ===\n" << manifest << "\n";
    }

    return ss.str();
}

std::string PromptAssembler::RenderTemplate(const std::string& tmpl, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        std::string key = tmpl.substr(open + 2, close - open - 2);
        auto it = vars.find(key);
        if (it != vars.end()) {
            out += it->second;
        } else {
            out.append(tmpl, open, close + 2 - open);
        }
        pos = close + 2;
    }
    return out;
}

bool PromptAssembler::HasPlaceholders(const std::string& text) {
    auto open = text.find("{{");
    return open != std::string::npos && text.find("}}", open) != std::string::npos;
}

std::string PromptAssembler::FormatMemories(const std::vector<domain::RecallHit>& memories) {
    if (memories.empty()) return "";
    std::stringstream ss;
    ss << "Relevant memories:\n";
    for (const auto& hit : memories) {
        ss << "- " << hit.text << "\n";
    }
    ss << "What's relevant among this?\n";
    return ss.str();
}

std::string PromptAssembler::FormatItems(const std::vector<domain::Percept>& items) {
    std::stringstream ss;
    for (const auto& item : items) {
        ss << "- [" << KindLabel(item.kind) << "] " << item.text << "\n";
    }
    return ss.str();
}

std::vector<PromptAssembler::ChatMessage> PromptAssembler::BuildDistillation(const PromptBundle& bundle) {
    if (HasPlaceholders(bundle.instruction)) {
        return {{ChatMessage::Role::User, RenderTemplate(bundle.instruction, bundle.variables())}};
    }

    std::string system = bundle.identity;
    if (!system.empty()) system += "\n\n";
    system += bundle.instruction;

    return {
        {ChatMessage::Role::System, system},
        {ChatMessage::Role::User, bundle.render()}
    };
}

std::vector<PromptAssembler::ChatMessage> PromptAssembler::BuildDecision(const PromptBundle& bundle) {
    if (HasPlaceholders(bundle.instruction)) {
        return {{ChatMessage::Role::User, RenderTemplate(bundle.instruction, bundle.variables())}};
    }

    std::stringstream ss;
    if (!bundle.identity.empty()) ss << bundle.identity << "\n\n";
    ss << bundle.render();
    ss << bundle.instruction;
    return {{ChatMessage::Role::User, ss.str()}};
}

} // namespace psyche::application
