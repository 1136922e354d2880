/**
 * @file RuntimeServices.hpp
 * @brief Container for the runtime's long-lived services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include <vector>
#include "application/DecisionEngine.hpp"
#include "application/Distiller.hpp"
#include "application/EventBus.hpp"
#include "application/MotorExecutor.hpp"
#include "application/MotorRegistry.hpp"
#include "application/Router.hpp"
#include "application/SensationIngestor.hpp"
#include "application/Supervisor.hpp"
#include "domain/MemoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace psyche::application {

struct RuntimeServices {
    std::shared_ptr<EventBus> bus;
    std::shared_ptr<Router> router;
    std::shared_ptr<infrastructure::PersistenceService> persistence;
    std::shared_ptr<domain::MemoryRepository> memoryStore;
    std::shared_ptr<MotorRegistry> motorRegistry;
    std::shared_ptr<MotorExecutor> motorExecutor;
    std::vector<std::shared_ptr<Distiller>> distillers;
    std::shared_ptr<DecisionEngine> will;
    std::shared_ptr<SensationIngestor> ingestor;
    std::unique_ptr<Supervisor> supervisor;
};

} // namespace psyche::application
