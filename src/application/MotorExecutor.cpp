#include "application/MotorExecutor.hpp"
#include "domain/Identifiers.hpp"
#include <iostream>
#include <thread>
#include <vector>

namespace psyche::application {

using namespace std::chrono_literals;

namespace {
constexpr auto kDispatchPoll = 100ms;
constexpr auto kBodyPoll = 50ms;
}

// --- MotorCallHandle -------------------------------------------------------

domain::MotorCall MotorCallHandle::call() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_call;
}

std::optional<domain::MotorOutcome> MotorCallHandle::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return m_outcome.has_value(); });
    return m_outcome;
}

std::optional<domain::MotorOutcome> MotorCallHandle::outcome() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outcome;
}

// --- MotorExecutor ---------------------------------------------------------

MotorExecutor::MotorExecutor(std::shared_ptr<MotorRegistry> registry,
                             MotorSettings settings,
                             std::shared_ptr<EventBus> bus)
    : m_registry(std::move(registry)),
      m_settings(settings),
      m_bus(std::move(bus)),
      m_queue(settings.maxPending) {}

std::shared_ptr<MotorCallHandle> MotorExecutor::execute(const domain::Intention& intention,
                                                        std::shared_ptr<BodyChannel> body) {
    auto handle = std::make_shared<MotorCallHandle>();
    handle->m_call.id = domain::GenerateId();
    handle->m_call.intentionId = intention.id;
    handle->m_call.action = domain::ToLower(intention.action);

    if (!m_queue.tryPush(PendingCall{handle, intention, std::move(body)})) {
        std::string reason = m_queue.closed() ? "executor stopped" : "dispatch queue full";
        std::cerr << "[MotorExecutor] Dropped <" << intention.action << ">: " << reason << std::endl;
        if (m_bus) m_bus->publish("motor/dropped", name(), intention.action + ": " + reason);
        return nullptr;
    }
    return handle;
}

size_t MotorExecutor::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight.size();
}

void MotorExecutor::run(UnitContext& context, CancellationToken& token) {
    while (!token.isCancelled()) {
        auto item = m_queue.popFor(kDispatchPoll);
        if (item) {
            if (m_settings.minDispatchInterval.count() > 0) {
                auto next = m_lastDispatch + m_settings.minDispatchInterval;
                auto now = std::chrono::steady_clock::now();
                if (next > now && token.waitFor(next - now)) {
                    // Shutdown arrived while rate limiting; cancel below with the rest.
                    begin(item->handle, context.memory);
                    interrupt(item->handle, domain::InterruptionCause::Cancelled, "runtime shutting down");
                    break;
                }
            }
            m_lastDispatch = std::chrono::steady_clock::now();
            dispatch(std::move(*item), context.memory);
        }
        expireTimedOut();
    }
    cancelAll(context.memory);
}

void MotorExecutor::begin(const std::shared_ptr<MotorCallHandle>& handle,
                          const std::shared_ptr<MemoryService>& memory) {
    domain::MotorCall call;
    {
        std::lock_guard<std::mutex> lock(handle->m_mutex);
        handle->m_call.started = domain::Clock::now();
        handle->m_memory = memory;
        call = handle->m_call;
    }
    if (memory) memory->recordMotorCall(call);
    if (m_bus) m_bus->publish("motor/call", name(), call.action + " " + call.id);
}

void MotorExecutor::dispatch(PendingCall item, const std::shared_ptr<MemoryService>& memory) {
    auto& handle = item.handle;
    begin(handle, memory);

    auto motor = m_registry->find(item.intention.action);
    if (!motor) {
        interrupt(handle, domain::InterruptionCause::Error, "unknown action: " + item.intention.action);
        return;
    }

    const domain::MotorSchema schema = motor->schema();
    for (const auto& attr : schema.required) {
        if (item.intention.attributes.find(attr) == item.intention.attributes.end()) {
            interrupt(handle, domain::InterruptionCause::Error, "missing required attribute: " + attr);
            return;
        }
    }

    std::shared_ptr<MotorCallHandle> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (schema.exclusive) {
            auto it = m_exclusive.find(handle->m_call.action);
            if (it != m_exclusive.end()) previous = it->second;
            m_exclusive[handle->m_call.action] = handle;
        }
        handle->m_deadline = std::chrono::steady_clock::now() + m_settings.actionTimeout;
        m_inFlight[handle->m_call.id] = handle;
    }
    if (previous) {
        interrupt(previous, domain::InterruptionCause::Superseded, "superseded by " + handle->m_call.id);
    }

    auto self = shared_from_this();
    std::thread([self, motor, item = std::move(item)]() mutable {
        self->perform(std::move(motor), std::move(item));
    }).detach();
}

void MotorExecutor::perform(std::shared_ptr<domain::Motor> motor, PendingCall item) {
    auto handle = item.handle;

    domain::MotorInvocation invocation;
    invocation.intention = item.intention;
    invocation.cancelled = [handle] { return handle->m_cancelled.load(); };

    if (item.body) {
        auto body = item.body;
        invocation.nextChunk = [handle, body]() -> std::optional<std::string> {
            while (!handle->m_cancelled.load()) {
                auto chunk = body->popFor(kBodyPoll);
                if (chunk) return chunk;
                if (body->closed()) return std::nullopt;
            }
            return std::nullopt;
        };
    } else {
        auto delivered = std::make_shared<bool>(false);
        std::string text = item.intention.body;
        invocation.nextChunk = [delivered, text]() -> std::optional<std::string> {
            if (*delivered || text.empty()) return std::nullopt;
            *delivered = true;
            return text;
        };
    }

    try {
        std::string result = motor->perform(invocation);
        if (handle->m_cancelled.load()) return;
        complete(handle, result);
    } catch (const std::exception& e) {
        interrupt(handle, domain::InterruptionCause::Error, e.what());
    } catch (...) {
        interrupt(handle, domain::InterruptionCause::Error, "unknown error in motor");
    }
}

void MotorExecutor::expireTimedOut() {
    std::vector<std::shared_ptr<MotorCallHandle>> expired;
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, handle] : m_inFlight) {
            if (handle->m_deadline <= now) expired.push_back(handle);
        }
    }
    for (const auto& handle : expired) {
        interrupt(handle, domain::InterruptionCause::Error,
                  "timed out after " + std::to_string(m_settings.actionTimeout.count()) + "ms");
    }
}

void MotorExecutor::cancelAll(const std::shared_ptr<MemoryService>& memory) {
    m_queue.close();
    while (auto item = m_queue.tryPop()) {
        begin(item->handle, memory);
        interrupt(item->handle, domain::InterruptionCause::Cancelled, "runtime shutting down");
    }

    std::vector<std::shared_ptr<MotorCallHandle>> running;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, handle] : m_inFlight) running.push_back(handle);
    }
    for (const auto& handle : running) {
        interrupt(handle, domain::InterruptionCause::Cancelled, "runtime shutting down");
    }
    if (!running.empty()) {
        std::cout << "[MotorExecutor] Cancelled " << running.size() << " in-flight call(s)" << std::endl;
    }
}

bool MotorExecutor::complete(const std::shared_ptr<MotorCallHandle>& handle, const std::string& result) {
    domain::MotorOutcome outcome;
    outcome.call = handle->call();
    outcome.completion = domain::Completion{domain::GenerateId(), outcome.call.id, result, domain::Clock::now()};
    return resolve(handle, std::move(outcome));
}

bool MotorExecutor::interrupt(const std::shared_ptr<MotorCallHandle>& handle,
                              domain::InterruptionCause cause, const std::string& detail) {
    domain::MotorOutcome outcome;
    outcome.call = handle->call();
    outcome.interruption = domain::Interruption{domain::GenerateId(), outcome.call.id, cause, detail, domain::Clock::now()};
    return resolve(handle, std::move(outcome));
}

bool MotorExecutor::resolve(const std::shared_ptr<MotorCallHandle>& handle, domain::MotorOutcome outcome) {
    bool expected = false;
    if (!handle->m_resolved.compare_exchange_strong(expected, true)) {
        return false;
    }
    handle->m_cancelled = true;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.erase(outcome.call.id);
        auto it = m_exclusive.find(outcome.call.action);
        if (it != m_exclusive.end() && it->second == handle) m_exclusive.erase(it);
    }

    std::shared_ptr<MemoryService> memory;
    {
        std::lock_guard<std::mutex> lock(handle->m_mutex);
        memory = handle->m_memory;
    }

    if (outcome.completion) {
        if (memory) memory->recordCompletion(*outcome.completion);
        if (m_bus) m_bus->publish("motor/completion", name(), outcome.call.action + ": " + outcome.completion->result);
    } else if (outcome.interruption) {
        const auto& interruption = *outcome.interruption;
        if (interruption.cause == domain::InterruptionCause::Error) {
            std::cerr << "[MotorExecutor] <" << outcome.call.action << "> failed: " << interruption.detail << std::endl;
        }
        if (memory) memory->recordInterruption(interruption);
        if (m_bus) {
            m_bus->publish("motor/interruption", name(),
                           outcome.call.action + " " + domain::CauseToString(interruption.cause) + ": " + interruption.detail);
        }
    }

    {
        std::lock_guard<std::mutex> lock(handle->m_mutex);
        handle->m_outcome = std::move(outcome);
    }
    handle->m_cv.notify_all();
    return true;
}

} // namespace psyche::application
