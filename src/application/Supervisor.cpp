/**
 * @file Supervisor.cpp
 * @brief Implementation of the Supervisor.
 */

#include "application/Supervisor.hpp"
#include "domain/Identifiers.hpp"
#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace psyche::application {

// State reachable from unit threads. Detached stragglers keep it alive.
struct Supervisor::Shared {
    SupervisorSettings settings;
    UnitContextFactory factory;
    std::shared_ptr<MemoryService> memory;
    std::shared_ptr<EventBus> bus;

    std::mutex mutex;
    std::condition_variable finishedCv;

    void record(const std::string& unit, domain::LifecycleKind kind, const std::string& detail) {
        domain::LifecycleEvent event;
        event.id = domain::GenerateId();
        event.unit = unit;
        event.kind = kind;
        event.detail = detail;
        event.timestamp = domain::Clock::now();

        auto label = domain::LifecycleKindToString(kind);
        if (kind == domain::LifecycleKind::Crashed || kind == domain::LifecycleKind::Exited ||
            kind == domain::LifecycleKind::Terminated) {
            std::cerr << "[Supervisor] " << unit << " " << label << (detail.empty() ? "" : ": " + detail) << std::endl;
        } else {
            std::cout << "[Supervisor] " << unit << " " << label << std::endl;
        }

        if (memory) memory->recordLifecycle(event);
        if (bus) bus->publish("lifecycle/" + label, unit, detail);
    }
};

struct Supervisor::Slot {
    std::shared_ptr<CognitiveUnit> unit;
    std::string name;
    std::thread thread;
    CancellationToken token;

    // Guarded by Shared::mutex.
    bool finished = false;
    int restarts = 0;
    int crashes = 0;
    std::string lastError;
};

Supervisor::Supervisor(SupervisorSettings settings,
                       UnitContextFactory contextFactory,
                       std::shared_ptr<MemoryService> lifecycleMemory,
                       std::shared_ptr<EventBus> bus)
    : m_shared(std::make_shared<Shared>()) {
    if (!contextFactory) {
        throw std::invalid_argument("Supervisor needs a UnitContext factory");
    }
    m_shared->settings = settings;
    m_shared->factory = std::move(contextFactory);
    m_shared->memory = std::move(lifecycleMemory);
    m_shared->bus = std::move(bus);
}

Supervisor::~Supervisor() {
    shutdown();
}

void Supervisor::registerUnit(std::shared_ptr<CognitiveUnit> unit) {
    if (m_started) {
        throw std::logic_error("Supervisor: units must be registered before start()");
    }
    auto slot = std::make_shared<Slot>();
    slot->name = unit->name();
    slot->unit = std::move(unit);
    m_slots.push_back(std::move(slot));
}

void Supervisor::start() {
    if (m_started) return;
    m_started = true;
    for (size_t i = 0; i < m_slots.size(); ++i) {
        auto slot = m_slots[i];
        slot->thread = std::thread(&Supervisor::RunUnit, m_shared, slot, static_cast<int>(i));
    }
    std::cout << "[Supervisor] Started " << m_slots.size() << " unit(s)" << std::endl;
}

void Supervisor::RunUnit(std::shared_ptr<Shared> shared, std::shared_ptr<Slot> slot, int coreIndex) {
    if (shared->settings.pinCores) PinToCore(slot->name, coreIndex);

    auto backoff = shared->settings.restartBase;
    int runs = 0;

    while (!slot->token.isCancelled()) {
        std::string failure;
        auto began = std::chrono::steady_clock::now();
        try {
            UnitContext context = shared->factory(slot->name);
            context.restartCount = runs;
            shared->record(slot->name, runs == 0 ? domain::LifecycleKind::Started : domain::LifecycleKind::Restarted,
                           runs == 0 ? "" : "restart #" + std::to_string(runs));
            slot->unit->run(context, slot->token);
            if (slot->token.isCancelled()) break;
            shared->record(slot->name, domain::LifecycleKind::Exited, "returned while the runtime was running");
            failure = "exited";
        } catch (const std::exception& e) {
            failure = e.what();
            shared->record(slot->name, domain::LifecycleKind::Crashed, failure);
        } catch (...) {
            failure = "unknown exception";
            shared->record(slot->name, domain::LifecycleKind::Crashed, failure);
        }

        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            ++slot->crashes;
            ++slot->restarts;
            slot->lastError = failure;
        }
        ++runs;

        if (slot->token.isCancelled()) break;
        // A unit that stayed up for a while starts over with the short delay.
        if (std::chrono::steady_clock::now() - began > shared->settings.restartMax) {
            backoff = shared->settings.restartBase;
        }
        if (slot->token.waitFor(backoff)) break;
        backoff = std::min(backoff * 2, shared->settings.restartMax);
    }

    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        slot->finished = true;
    }
    shared->finishedCv.notify_all();
}

void Supervisor::PinToCore(const std::string& unitName, int coreIndex) {
#ifdef __linux__
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores == 0) return;
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(static_cast<unsigned int>(coreIndex) % cores, &set);
    int rc = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &set);
    if (rc != 0) {
        std::cerr << "[Supervisor] Could not pin " << unitName << " to core " << (coreIndex % cores)
                  << " (error " << rc << ")" << std::endl;
    }
#else
    std::cerr << "[Supervisor] Core pinning is not supported on this platform (" << unitName << ")" << std::endl;
    (void)coreIndex;
#endif
}

void Supervisor::shutdown() {
    if (!m_started || m_stopped) return;
    m_stopped = true;

    std::cout << "[Supervisor] Shutting down..." << std::endl;
    for (auto& slot : m_slots) slot->token.cancel();
    for (auto& slot : m_slots) slot->unit->onShutdown();

    auto deadline = std::chrono::steady_clock::now() + m_shared->settings.shutdownTimeout;
    {
        std::unique_lock<std::mutex> lock(m_shared->mutex);
        m_shared->finishedCv.wait_until(lock, deadline, [this] {
            return std::all_of(m_slots.begin(), m_slots.end(), [](const auto& s) { return s->finished; });
        });
    }

    for (auto& slot : m_slots) {
        bool finished;
        {
            std::lock_guard<std::mutex> lock(m_shared->mutex);
            finished = slot->finished;
        }
        if (!slot->thread.joinable()) continue;
        if (finished) {
            slot->thread.join();
            m_shared->record(slot->name, domain::LifecycleKind::Stopped, "");
        } else {
            slot->thread.detach();
            m_shared->record(slot->name, domain::LifecycleKind::Terminated,
                             "still running after " + std::to_string(m_shared->settings.shutdownTimeout.count()) + "ms");
        }
    }
}

std::vector<UnitStatus> Supervisor::statuses() const {
    std::vector<UnitStatus> result;
    std::lock_guard<std::mutex> lock(m_shared->mutex);
    for (const auto& slot : m_slots) {
        UnitStatus status;
        status.name = slot->name;
        status.running = m_started && !slot->finished;
        status.restarts = slot->restarts;
        status.crashes = slot->crashes;
        status.lastError = slot->lastError;
        result.push_back(status);
    }
    return result;
}

} // namespace psyche::application
