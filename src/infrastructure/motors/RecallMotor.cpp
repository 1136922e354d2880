#include "infrastructure/motors/RecallMotor.hpp"
#include "domain/Identifiers.hpp"
#include <stdexcept>

namespace psyche::infrastructure {

RecallMotor::RecallMotor(std::shared_ptr<application::MemoryService> memory,
                         std::shared_ptr<application::Router> router,
                         size_t defaultLimit)
    : m_memory(std::move(memory)), m_router(std::move(router)), m_defaultLimit(defaultLimit) {}

domain::MotorSchema RecallMotor::schema() const {
    domain::MotorSchema s;
    s.name = "recall";
    s.description = "Remember past moments related to the body";
    s.optional = {"limit"};
    return s;
}

std::string RecallMotor::perform(domain::MotorInvocation& invocation) {
    std::string query = domain::Trim(invocation.readBody());
    if (query.empty()) {
        throw std::invalid_argument("recall needs something to remember");
    }

    size_t limit = m_defaultLimit;
    auto attr = invocation.intention.attributes.find("limit");
    if (attr != invocation.intention.attributes.end()) {
        try {
            int parsed = std::stoi(attr->second);
            if (parsed > 0) limit = static_cast<size_t>(parsed);
        } catch (const std::exception&) {
            throw std::invalid_argument("recall limit is not a number: " + attr->second);
        }
    }

    auto hits = m_memory->recall(query, limit);
    if (hits.empty()) return "nothing recalled";

    std::string text = "I remember:";
    for (const auto& hit : hits) {
        text += "\n- " + hit.text;
    }

    domain::Sensation sensation;
    sensation.timestamp = domain::Clock::now();
    sensation.kind = "sensation/recall";
    sensation.source = "recall";
    sensation.text = text;
    if (m_memory->recordSensation(sensation) != domain::InsertOutcome::Duplicate) {
        m_router->route(domain::Percept::FromSensation(sensation));
    }
    return "recalled " + std::to_string(hits.size()) + " memories";
}

} // namespace psyche::infrastructure
