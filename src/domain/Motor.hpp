/**
 * @file Motor.hpp
 * @brief Interface implemented by every effector the agent can drive.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/Entities.hpp"

namespace psyche::domain {

/**
 * @struct MotorSchema
 * @brief What an action accepts. Rendered verbatim into the decision prompt.
 */
struct MotorSchema {
    std::string name;
    std::string description;
    std::vector<std::string> required;
    std::vector<std::string> optional;
    bool streamsBody = false;
    /** Only one call of an exclusive motor may be in flight; a newer one supersedes it. */
    bool exclusive = false;
};

/**
 * @struct MotorInvocation
 * @brief Everything a motor sees while performing one Intention.
 */
struct MotorInvocation {
    Intention intention;

    /**
     * Blocks until the next body chunk is available. Returns nullopt once the
     * body is complete or the call was cancelled.
     */
    std::function<std::optional<std::string>()> nextChunk;

    std::function<bool()> cancelled;

    /** @brief Drains the remaining body into one string. */
    std::string readBody() {
        std::string body;
        while (auto chunk = nextChunk()) {
            body += *chunk;
        }
        return body;
    }
};

/**
 * @class Motor
 * @brief A named action implementation.
 */
class Motor {
public:
    virtual ~Motor() = default;

    virtual MotorSchema schema() const = 0;

    /**
     * @brief Performs the action.
     * @return A short result summary recorded in the Completion.
     * @throws std::exception on failure; the executor records an Interruption.
     */
    virtual std::string perform(MotorInvocation& invocation) = 0;
};

} // namespace psyche::domain
