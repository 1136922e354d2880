/**
 * @file DecisionEngine.hpp
 * @brief Cognitive unit that turns the current situation into action tags ("Will").
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "application/CognitiveUnit.hpp"
#include "application/EventBus.hpp"
#include "application/MotorExecutor.hpp"
#include "application/Router.hpp"
#include "application/RuntimeConfig.hpp"

namespace psyche::application {

/** @brief What one decision cycle did. */
struct DecisionResult {
    bool throttled = false;
    bool invoked = false;
    bool failed = false;
    std::vector<domain::Intention> intentions;
    std::vector<std::shared_ptr<MotorCallHandle>> calls;
    std::string thought;
};

/**
 * @class DecisionEngine
 * @brief Streams the model's reply through a StreamingTagParser and dispatches
 *        each recognized action to the MotorExecutor as soon as possible.
 */
class DecisionEngine : public CognitiveUnit {
public:
    DecisionEngine(DecisionConfig config,
                   std::shared_ptr<Router> router,
                   std::shared_ptr<MotorExecutor> executor,
                   CognitionSettings cognition,
                   std::shared_ptr<EventBus> bus = nullptr);

    std::string name() const override { return "will"; }

    void run(UnitContext& context, CancellationToken& token) override;

    /** @brief Closes the input queue. */
    void onShutdown() override { m_input->close(); }

    /**
     * @brief Runs one decision over the given impression.
     *
     * Skips the model entirely when the rendered snapshot equals the previous
     * one and less than `minInterval` has passed.
     */
    DecisionResult decide(const domain::Percept& impression, UnitContext& context, const CancellationToken& token);

    static std::string ThoughtText(const std::string& freeText) { return "I thought to myself: " + freeText; }

private:
    void broadcastThought(const std::string& thought, UnitContext& context);

    DecisionConfig m_config;
    std::shared_ptr<Router> m_router;
    std::shared_ptr<MotorExecutor> m_executor;
    std::shared_ptr<PerceptQueue> m_input;
    CognitionSettings m_cognition;
    std::shared_ptr<EventBus> m_bus;

    std::string m_lastHash;
    std::chrono::steady_clock::time_point m_lastEvaluation{};
    int m_consecutiveFailures = 0;
};

} // namespace psyche::application
