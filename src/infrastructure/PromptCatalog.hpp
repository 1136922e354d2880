/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the default instruction texts.
 */

#pragma once

#include <string>
#include "domain/Entities.hpp"

namespace psyche::infrastructure {

class PromptCatalog {
public:
    /** @brief Returns the default distillation instruction for an impression level. */
    static std::string GetDistillerPrompt(domain::ImpressionLevel level);

    /**
     * @brief Returns the default decision template.
     * Uses the {{identity}}, {{situation}}, {{memories}} and {{motors}} placeholders.
     */
    static std::string GetWillPrompt();
};

} // namespace psyche::infrastructure
