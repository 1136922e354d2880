/**
 * @file Router.hpp
 * @brief Delivers percepts to the input queues of the units subscribed to their kind.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/MessageQueue.hpp"
#include "domain/Entities.hpp"

namespace psyche::application {

using PerceptQueue = MessageQueue<domain::Percept>;

/**
 * @class Router
 * @brief Kind-prefix routing table. "sensation" matches "sensation/chat";
 *        "impression/instant" matches only that kind and its sub-kinds.
 */
class Router {
public:
    /** @brief Returns the input queue of a unit, creating an unbounded one on first use. */
    std::shared_ptr<PerceptQueue> queueFor(const std::string& target);

    void addRoute(const std::string& kindPrefix, const std::string& target);

    /** @return Number of queues the percept was delivered to. */
    size_t route(const domain::Percept& percept);

    /** @brief Direct delivery, bypassing the table (used for feedback). */
    bool deliver(const std::string& target, const domain::Percept& percept);

    /** @brief Targets whose routes match the kind. */
    std::vector<std::string> targetsFor(const std::string& kind) const;

    void closeAll();

    static bool KindMatches(const std::string& prefix, const std::string& kind);

private:
    std::map<std::string, std::shared_ptr<PerceptQueue>> m_queues;
    std::vector<std::pair<std::string, std::string>> m_routes;
    mutable std::mutex m_mutex;
};

} // namespace psyche::application
