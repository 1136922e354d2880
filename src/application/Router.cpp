#include "application/Router.hpp"
#include <iostream>

namespace psyche::application {

bool Router::KindMatches(const std::string& prefix, const std::string& kind) {
    if (prefix.empty()) return true;
    if (kind.compare(0, prefix.size(), prefix) != 0) return false;
    return kind.size() == prefix.size() || kind[prefix.size()] == '/';
}

std::shared_ptr<PerceptQueue> Router::queueFor(const std::string& target) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& queue = m_queues[target];
    if (!queue) queue = std::make_shared<PerceptQueue>();
    return queue;
}

void Router::addRoute(const std::string& kindPrefix, const std::string& target) {
    queueFor(target);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_routes.emplace_back(kindPrefix, target);
}

std::vector<std::string> Router::targetsFor(const std::string& kind) const {
    std::vector<std::string> targets;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [prefix, target] : m_routes) {
        if (!KindMatches(prefix, kind)) continue;
        bool seen = false;
        for (const auto& t : targets) seen = seen || t == target;
        if (!seen) targets.push_back(target);
    }
    return targets;
}

size_t Router::route(const domain::Percept& percept) {
    size_t delivered = 0;
    for (const auto& target : targetsFor(percept.kind)) {
        if (deliver(target, percept)) ++delivered;
    }
    if (delivered == 0) {
        std::cout << "[Router] No unit listens to '" << percept.kind << "'" << std::endl;
    }
    return delivered;
}

bool Router::deliver(const std::string& target, const domain::Percept& percept) {
    std::shared_ptr<PerceptQueue> queue;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_queues.find(target);
        if (it != m_queues.end()) queue = it->second;
    }
    if (!queue) {
        std::cerr << "[Router] Unknown target '" << target << "' for " << percept.kind << std::endl;
        return false;
    }
    return queue->push(percept);
}

void Router::closeAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [name, queue] : m_queues) {
        queue->close();
    }
}

} // namespace psyche::application
