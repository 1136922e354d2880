#include "infrastructure/PromptCatalog.hpp"

namespace psyche::infrastructure {

std::string PromptCatalog::GetDistillerPrompt(domain::ImpressionLevel level) {
    switch (level) {
    case domain::ImpressionLevel::Instant:
        return
            "From these recent sensations, infer what is happening. "
            "Generate a brief summary, emphasizing what is important and omitting what isn't. "
            "Use the first person perspective from your point of view. Be terse and concise. "
            "Use only the information provided, without inventing new details (this is real life, not fiction). "
            "Do not speak to anyone here; these are your internal thoughts. "
            "Limit it to one sentence.";

    case domain::ImpressionLevel::Situation:
        return
            "Combine recent instants into a coherent summary of the current situation, "
            "as if explaining to yourself what is happening now. "
            "Emphasize what is important and omit what isn't. "
            "Use the first person perspective from your point of view. Be terse and concise. "
            "Use only the information provided, without inventing new details (this is real life, not fiction). "
            "Do not speak to anyone here; these are your internal thoughts. "
            "Limit it to one sentence.";

    case domain::ImpressionLevel::Episode:
        return
            "These situations happened one after another. "
            "Tell yourself, in the first person, the episode they form: who was involved, what changed and how it ended. "
            "Do not invent details. Limit it to two sentences.";

    case domain::ImpressionLevel::Narrative:
        return
            "These episodes are part of your recent life. "
            "Write, in the first person, the story they tell about you and the people around you. "
            "Keep only what will matter later. Do not invent details. Limit it to three sentences.";
    }
    return "";
}

std::string PromptCatalog::GetWillPrompt() {
    return
        "{{identity}}\n\n"
        "This is what is happening right now:\n"
        "{{situation}}\n\n"
        "{{memories}}\n"
        "You can act on the world by writing action tags. Available actions:\n"
        "{{motors}}\n"
        "Think to yourself in plain text first, briefly. Then choose at least one action and write it as a tag, "
        "for example <speak>Hello there.</speak>. Attributes go inside the opening tag as key=\"value\". "
        "Use only the actions listed above and do not nest tags.";
}

} // namespace psyche::infrastructure
