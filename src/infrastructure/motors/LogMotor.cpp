#include "infrastructure/motors/LogMotor.hpp"
#include <iostream>

namespace psyche::infrastructure {

domain::MotorSchema LogMotor::schema() const {
    domain::MotorSchema s;
    s.name = "log";
    s.description = "Write a note to your own log";
    s.optional = {"level"};
    return s;
}

std::string LogMotor::perform(domain::MotorInvocation& invocation) {
    std::string body = invocation.readBody();
    auto level = invocation.intention.attributes.find("level");
    if (level != invocation.intention.attributes.end() && level->second == "error") {
        std::cerr << "[Log] " << body << std::endl;
    } else {
        std::cout << "[Log] " << body << std::endl;
    }
    return "logged " + std::to_string(body.size()) + " chars";
}

} // namespace psyche::infrastructure
