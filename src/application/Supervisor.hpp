/**
 * @file Supervisor.hpp
 * @brief Runs every cognitive unit on its own thread and restarts the ones that fail.
 */

#pragma once

#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "application/CognitiveUnit.hpp"
#include "application/EventBus.hpp"
#include "application/MemoryService.hpp"
#include "application/RuntimeConfig.hpp"

namespace psyche::application {

struct UnitStatus {
    std::string name;
    bool running = false;
    int restarts = 0;
    int crashes = 0;
    std::string lastError;
};

/**
 * @class Supervisor
 * @brief One thread per unit, restart with capped exponential backoff, bounded shutdown.
 *
 * A unit that throws, or returns while its token is live, is restarted with a
 * fresh UnitContext. Siblings keep running. Every transition is recorded as a
 * LifecycleEvent in memory and on the event bus.
 */
class Supervisor {
public:
    /**
     * @param lifecycleMemory Memory handle used for lifecycle records; may be null.
     */
    Supervisor(SupervisorSettings settings,
               UnitContextFactory contextFactory,
               std::shared_ptr<MemoryService> lifecycleMemory = nullptr,
               std::shared_ptr<EventBus> bus = nullptr);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /** @brief Adds a unit. Must be called before start(). */
    void registerUnit(std::shared_ptr<CognitiveUnit> unit);

    void start();

    /**
     * @brief Cancels every unit and waits up to the shutdown timeout.
     * Units still running afterwards are detached and recorded as terminated.
     */
    void shutdown();

    std::vector<UnitStatus> statuses() const;

    bool running() const { return m_started && !m_stopped; }

private:
    struct Shared;
    struct Slot;

    static void RunUnit(std::shared_ptr<Shared> shared, std::shared_ptr<Slot> slot, int coreIndex);
    static void PinToCore(const std::string& unitName, int coreIndex);

    std::shared_ptr<Shared> m_shared;
    std::vector<std::shared_ptr<Slot>> m_slots;
    bool m_started = false;
    bool m_stopped = false;
};

} // namespace psyche::application
