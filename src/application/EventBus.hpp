/**
 * @file EventBus.hpp
 * @brief Subscribable stream of runtime events for external monitoring.
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "domain/Entities.hpp"

namespace psyche::application {

/**
 * @struct RuntimeEvent
 * @brief One observability event. Topics are paths such as "lifecycle/restarted",
 *        "thought", "motor/interruption" or "health/degraded".
 */
struct RuntimeEvent {
    std::string topic;
    std::string source;
    std::string message;
    domain::Timestamp timestamp = domain::Clock::now();
};

/**
 * @class EventBus
 * @brief Delivers events synchronously to every subscriber whose prefix matches.
 *
 * Not required for correctness: a failing subscriber is logged and skipped.
 */
class EventBus {
public:
    using Handler = std::function<void(const RuntimeEvent&)>;

    /** @return Subscription id for unsubscribe(). */
    int subscribe(Handler handler, const std::string& topicPrefix = "");
    void unsubscribe(int subscriptionId);

    void publish(const RuntimeEvent& event);
    void publish(const std::string& topic, const std::string& source, const std::string& message);

private:
    struct Subscription {
        int id;
        std::string prefix;
        Handler handler;
    };

    std::vector<Subscription> m_subscriptions;
    std::mutex m_mutex;
    int m_nextId = 1;
};

} // namespace psyche::application
