/**
 * @file PsycheApp.hpp
 * @brief Main application class for the psyche daemon.
 */

#pragma once

#include <memory>
#include "application/RuntimeConfig.hpp"
#include "application/RuntimeServices.hpp"

namespace psyche::infrastructure {
class MemoryStoreFs;
}

namespace psyche::app {

/**
 * @class PsycheApp
 * @brief Orchestrates the daemon lifecycle: wiring, the wait loop, and shutdown.
 */
class PsycheApp {
public:
    explicit PsycheApp(application::RuntimeConfig config);
    ~PsycheApp();

    /**
     * @brief Starts every unit and blocks until SIGINT or SIGTERM.
     * @return Exit code (0 for success).
     */
    int Run();

    /**
     * @brief Builds the memory layer, routing table, motors and units, then starts the Supervisor.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Stops the units and flushes memory. Safe to call twice. */
    void Shutdown();

    const application::RuntimeServices& services() const { return m_services; }

private:
    application::UnitContextFactory makeContextFactory();
    void registerMotors();
    void printEvents();

    application::RuntimeConfig m_config;
    application::RuntimeServices m_services;
    std::shared_ptr<infrastructure::MemoryStoreFs> m_store;
    int m_printerSubscription = 0;
    bool m_initialized = false;
};

} // namespace psyche::app
