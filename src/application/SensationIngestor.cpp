#include "application/SensationIngestor.hpp"
#include "domain/Identifiers.hpp"
#include "infrastructure/SocketIngress.hpp"
#include <iostream>
#include <stdexcept>

namespace psyche::application {

SensationIngestor::SensationIngestor(std::string socketPath,
                                     std::shared_ptr<Router> router,
                                     std::shared_ptr<EventBus> bus,
                                     bool verbose)
    : m_socketPath(std::move(socketPath)),
      m_router(std::move(router)),
      m_bus(std::move(bus)),
      m_verbose(verbose) {}

void SensationIngestor::run(UnitContext& context, CancellationToken& token) {
    infrastructure::SocketIngress ingress(m_socketPath);
    if (!ingress.start()) {
        throw std::runtime_error("[SensationIngestor] Cannot listen on " + m_socketPath);
    }

    while (!token.isCancelled()) {
        for (const auto& frame : ingress.poll(100)) {
            ingest(frame.path, frame.text, "socket", context);
        }
    }
    ingress.stop();
}

bool SensationIngestor::ingest(const std::string& path, const std::string& text, const std::string& source,
                               UnitContext& context) {
    if (domain::Trim(text).empty()) {
        std::cerr << "[SensationIngestor] Dropping empty frame on " << path << std::endl;
        return false;
    }

    domain::Sensation sensation;
    sensation.timestamp = domain::Clock::now();
    sensation.kind = "sensation" + path;
    sensation.source = source;
    sensation.text = text;

    if (context.memory) {
        auto outcome = context.memory->recordSensation(sensation);
        if (outcome == domain::InsertOutcome::Duplicate) {
            if (m_verbose) {
                std::cout << "[SensationIngestor] Duplicate of " << sensation.id << ", not routed" << std::endl;
            }
            return false;
        }
    } else {
        sensation.id = domain::GenerateId();
    }

    if (m_verbose) {
        std::cout << "[SensationIngestor] " << sensation.kind << ": " << sensation.text << std::endl;
    }
    if (m_bus) m_bus->publish("sensation", sensation.source, sensation.kind + ": " + sensation.text);
    m_router->route(domain::Percept::FromSensation(sensation));
    return true;
}

} // namespace psyche::application
