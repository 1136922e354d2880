/**
 * @file CognitiveUnit.hpp
 * @brief Interface of everything the Supervisor schedules.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include "application/CancellationToken.hpp"
#include "application/MemoryService.hpp"
#include "domain/AIService.hpp"

namespace psyche::application {

/**
 * @struct UnitContext
 * @brief Resource handles private to one run of a unit. Rebuilt on every restart.
 */
struct UnitContext {
    std::shared_ptr<domain::AIService> ai;
    std::shared_ptr<MemoryService> memory;
    int restartCount = 0;
};

using UnitContextFactory = std::function<UnitContext(const std::string& unitName)>;

/**
 * @class CognitiveUnit
 * @brief A long-running loop owned by the Supervisor.
 *
 * run() returns when the token is cancelled. Throwing, or returning while the
 * token is still live, counts as a crash and leads to a restart.
 */
class CognitiveUnit {
public:
    virtual ~CognitiveUnit() = default;

    virtual std::string name() const = 0;

    virtual void run(UnitContext& context, CancellationToken& token) = 0;

    /** @brief Called on shutdown after the token is cancelled, to wake blocking waits. */
    virtual void onShutdown() {}
};

} // namespace psyche::application
