/**
 * @file MotorExecutor.hpp
 * @brief Rate-limited dispatcher turning Intentions into audited MotorCalls.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/CognitiveUnit.hpp"
#include "application/EventBus.hpp"
#include "application/MessageQueue.hpp"
#include "application/MotorRegistry.hpp"
#include "application/RuntimeConfig.hpp"
#include "domain/Entities.hpp"

namespace psyche::application {

/** Body chunks of a streaming action. Closed by the producer when the tag ends. */
using BodyChannel = MessageQueue<std::string>;

/**
 * @class MotorCallHandle
 * @brief Caller's view of one dispatched Intention.
 */
class MotorCallHandle {
public:
    domain::MotorCall call() const;

    /** @brief Blocks until the call resolves or the timeout passes. */
    std::optional<domain::MotorOutcome> wait(std::chrono::milliseconds timeout) const;

    std::optional<domain::MotorOutcome> outcome() const;
    bool resolved() const { return m_resolved.load(); }

private:
    friend class MotorExecutor;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    domain::MotorCall m_call;
    std::optional<domain::MotorOutcome> m_outcome;

    std::atomic<bool> m_resolved{false};
    std::atomic<bool> m_cancelled{false};
    std::chrono::steady_clock::time_point m_deadline;
    std::shared_ptr<MemoryService> m_memory;
};

/**
 * @class MotorExecutor
 * @brief Owns the dispatch queue and every in-flight MotorCall.
 *
 * Each MotorCall resolves exactly once, to a Completion or an Interruption.
 * Actions run on their own threads so a slow motor never stalls dispatch.
 */
class MotorExecutor : public CognitiveUnit, public std::enable_shared_from_this<MotorExecutor> {
public:
    MotorExecutor(std::shared_ptr<MotorRegistry> registry,
                  MotorSettings settings,
                  std::shared_ptr<EventBus> bus = nullptr);

    std::string name() const override { return "motors"; }

    /**
     * @brief Queues an Intention for dispatch.
     * @param body Channel for a body still being streamed; null means the
     *             Intention's body is already complete.
     * @return nullptr when the queue is full or the executor has stopped.
     */
    std::shared_ptr<MotorCallHandle> execute(const domain::Intention& intention,
                                             std::shared_ptr<BodyChannel> body = nullptr);

    void run(UnitContext& context, CancellationToken& token) override;

    std::shared_ptr<MotorRegistry> registry() const { return m_registry; }

    size_t pending() const { return m_queue.size(); }
    size_t inFlight() const;

private:
    struct PendingCall {
        std::shared_ptr<MotorCallHandle> handle;
        domain::Intention intention;
        std::shared_ptr<BodyChannel> body;
    };

    /** @brief Stamps and records the MotorCall. */
    void begin(const std::shared_ptr<MotorCallHandle>& handle, const std::shared_ptr<MemoryService>& memory);
    void dispatch(PendingCall item, const std::shared_ptr<MemoryService>& memory);
    void perform(std::shared_ptr<domain::Motor> motor, PendingCall item);
    void expireTimedOut();
    void cancelAll(const std::shared_ptr<MemoryService>& memory);

    bool complete(const std::shared_ptr<MotorCallHandle>& handle, const std::string& result);
    bool interrupt(const std::shared_ptr<MotorCallHandle>& handle,
                   domain::InterruptionCause cause, const std::string& detail);
    bool resolve(const std::shared_ptr<MotorCallHandle>& handle, domain::MotorOutcome outcome);

    std::shared_ptr<MotorRegistry> m_registry;
    MotorSettings m_settings;
    std::shared_ptr<EventBus> m_bus;

    MessageQueue<PendingCall> m_queue;
    std::chrono::steady_clock::time_point m_lastDispatch{};

    std::map<std::string, std::shared_ptr<MotorCallHandle>> m_inFlight;  // by call id
    std::map<std::string, std::shared_ptr<MotorCallHandle>> m_exclusive; // by action
    mutable std::mutex m_mutex;
};

} // namespace psyche::application
