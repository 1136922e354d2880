#pragma once

#include <memory>
#include "application/MemoryService.hpp"
#include "application/Router.hpp"
#include "domain/Motor.hpp"

namespace psyche::infrastructure {

/**
 * @brief Looks up memories related to the body and feeds them back as a
 *        "sensation/recall" percept.
 */
class RecallMotor : public domain::Motor {
public:
    RecallMotor(std::shared_ptr<application::MemoryService> memory,
                std::shared_ptr<application::Router> router,
                size_t defaultLimit = 3);

    domain::MotorSchema schema() const override;
    std::string perform(domain::MotorInvocation& invocation) override;

private:
    std::shared_ptr<application::MemoryService> m_memory;
    std::shared_ptr<application::Router> m_router;
    size_t m_defaultLimit;
};

} // namespace psyche::infrastructure
