#include "application/EventBus.hpp"
#include <algorithm>
#include <iostream>

namespace psyche::application {

int EventBus::subscribe(Handler handler, const std::string& topicPrefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    int id = m_nextId++;
    m_subscriptions.push_back(Subscription{id, topicPrefix, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(int subscriptionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscriptions.erase(
        std::remove_if(m_subscriptions.begin(), m_subscriptions.end(),
            [subscriptionId](const Subscription& s) { return s.id == subscriptionId; }),
        m_subscriptions.end());
}

void EventBus::publish(const RuntimeEvent& event) {
    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets = m_subscriptions;
    }

    for (const auto& sub : targets) {
        if (event.topic.compare(0, sub.prefix.size(), sub.prefix) != 0) continue;
        try {
            sub.handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[EventBus] Subscriber " << sub.id << " failed on '" << event.topic << "': " << e.what() << std::endl;
        }
    }
}

void EventBus::publish(const std::string& topic, const std::string& source, const std::string& message) {
    publish(RuntimeEvent{topic, source, message, domain::Clock::now()});
}

} // namespace psyche::application
