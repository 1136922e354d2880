/**
 * @file RetryPolicy.hpp
 * @brief Bounded exponential backoff for language model calls.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "application/CancellationToken.hpp"

namespace psyche::application {

struct RetryPolicy {
    int maxRetries = 3;
    std::chrono::milliseconds baseDelay{200};
    std::chrono::milliseconds maxDelay{5000};

    /** @brief Backoff before retry number `attempt` (0-based). */
    std::chrono::milliseconds delayFor(int attempt) const;

    /**
     * @brief Runs `attempt` until it returns true, at most 1 + maxRetries times.
     * @param attempt Receives the 0-based attempt number.
     * @param token Aborts the backoff sleep and further attempts when cancelled.
     * @param tag Log prefix, e.g. "[Distiller:quick]".
     * @return true if some attempt succeeded.
     */
    bool run(const std::function<bool(int)>& attempt, const CancellationToken& token, const std::string& tag) const;
};

} // namespace psyche::application
