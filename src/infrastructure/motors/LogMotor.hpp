#pragma once

#include "domain/Motor.hpp"

namespace psyche::infrastructure {

/** @brief Writes the body to the runtime log. */
class LogMotor : public domain::Motor {
public:
    domain::MotorSchema schema() const override;
    std::string perform(domain::MotorInvocation& invocation) override;
};

} // namespace psyche::infrastructure
