/**
 * @file MotorRegistry.hpp
 * @brief Table of available actions, shared by the manifest renderer and the dispatcher.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/Motor.hpp"

namespace psyche::application {

class MotorRegistry {
public:
    /** @brief Adds or replaces a motor under its lower-cased schema name. */
    void registerMotor(std::shared_ptr<domain::Motor> motor);

    std::shared_ptr<domain::Motor> find(const std::string& action) const;
    bool contains(const std::string& action) const;

    std::vector<domain::MotorSchema> schemas() const;
    std::vector<std::string> names() const;

    /**
     * @brief One line per action, sorted by name:
     *        `<name attr="..."> body </name>: description (required: a; optional: b; streams body)`
     */
    std::string renderManifest() const;

    static std::string RenderSchema(const domain::MotorSchema& schema);

private:
    std::map<std::string, std::shared_ptr<domain::Motor>> m_motors;
    mutable std::mutex m_mutex;
};

} // namespace psyche::application
