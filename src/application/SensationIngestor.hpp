/**
 * @file SensationIngestor.hpp
 * @brief Input adapter unit: socket frames become stored, routed Sensations.
 */

#pragma once

#include <memory>
#include <string>
#include "application/CognitiveUnit.hpp"
#include "application/EventBus.hpp"
#include "application/Router.hpp"

namespace psyche::application {

class SensationIngestor : public CognitiveUnit {
public:
    SensationIngestor(std::string socketPath,
                      std::shared_ptr<Router> router,
                      std::shared_ptr<EventBus> bus = nullptr,
                      bool verbose = false);

    std::string name() const override { return "ingress"; }

    /** @throws std::runtime_error when the socket cannot be opened. */
    void run(UnitContext& context, CancellationToken& token) override;

    /**
     * @brief Stores one Sensation of kind "sensation" + path and routes it.
     * @return true if it was new and routed; duplicates and empty text are dropped.
     */
    bool ingest(const std::string& path, const std::string& text, const std::string& source, UnitContext& context);

private:
    std::string m_socketPath;
    std::shared_ptr<Router> m_router;
    std::shared_ptr<EventBus> m_bus;
    bool m_verbose;
};

} // namespace psyche::application
