/**
 * @file Distiller.hpp
 * @brief Cognitive unit that condenses a window of percepts into one Impression.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/CognitiveUnit.hpp"
#include "application/EventBus.hpp"
#include "application/Router.hpp"
#include "application/RuntimeConfig.hpp"

namespace psyche::application {

/**
 * @class Distiller
 * @brief Rolling-window summarizer ("Wit").
 *
 * Buffers routed percepts until `batchSize` items arrived or `quiescence`
 * elapsed since the last distillation, then asks the model for a first-person
 * summary. One distillation is in flight at a time; inputs keep arrival order.
 */
class Distiller : public CognitiveUnit {
public:
    Distiller(DistillerConfig config,
              std::shared_ptr<Router> router,
              CognitionSettings cognition,
              std::shared_ptr<EventBus> bus = nullptr);

    std::string name() const override { return m_config.name; }

    void run(UnitContext& context, CancellationToken& token) override;

    /** @brief Closes the input queue. */
    void onShutdown() override { m_input->close(); }

    /**
     * @brief Summarizes one window, stores and routes the result.
     * @return The new Impression, or nullopt when the window was dropped.
     */
    std::optional<domain::Impression> distill(const std::vector<domain::Percept>& window,
                                              UnitContext& context,
                                              const CancellationToken& token);

    const DistillerConfig& config() const { return m_config; }
    int consecutiveFailures() const { return m_consecutiveFailures; }

private:
    std::string tag() const { return "[Distiller:" + m_config.name + "]"; }
    void deliverFeedback(const domain::Impression& impression, UnitContext& context);

    DistillerConfig m_config;
    std::shared_ptr<Router> m_router;
    std::shared_ptr<PerceptQueue> m_input;
    CognitionSettings m_cognition;
    std::shared_ptr<EventBus> m_bus;
    int m_consecutiveFailures = 0;
};

} // namespace psyche::application
