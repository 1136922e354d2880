#include "application/MotorRegistry.hpp"
#include "domain/Identifiers.hpp"
#include <sstream>
#include <stdexcept>

namespace psyche::application {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

} // namespace

void MotorRegistry::registerMotor(std::shared_ptr<domain::Motor> motor) {
    if (!motor) {
        throw std::invalid_argument("MotorRegistry: null motor");
    }
    std::string name = domain::ToLower(motor->schema().name);
    if (name.empty()) {
        throw std::invalid_argument("MotorRegistry: motor without a name");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_motors[name] = std::move(motor);
}

std::shared_ptr<domain::Motor> MotorRegistry::find(const std::string& action) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_motors.find(domain::ToLower(action));
    if (it == m_motors.end()) return nullptr;
    return it->second;
}

bool MotorRegistry::contains(const std::string& action) const {
    return find(action) != nullptr;
}

std::vector<domain::MotorSchema> MotorRegistry::schemas() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::MotorSchema> result;
    for (const auto& [name, motor] : m_motors) {
        result.push_back(motor->schema());
    }
    return result;
}

std::vector<std::string> MotorRegistry::names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    for (const auto& [name, motor] : m_motors) {
        result.push_back(name);
    }
    return result;
}

std::string MotorRegistry::RenderSchema(const domain::MotorSchema& schema) {
    std::string name = domain::ToLower(schema.name);
    std::stringstream ss;
    ss << "<" << name;
    for (const auto& attr : schema.required) {
        ss << " " << attr << "=\"...\"";
    }
    ss << "> body </" << name << ">: " << schema.description;

    std::vector<std::string> notes;
    if (!schema.required.empty()) notes.push_back("required: " + JoinNames(schema.required));
    if (!schema.optional.empty()) notes.push_back("optional: " + JoinNames(schema.optional));
    if (schema.streamsBody) notes.push_back("streams body");
    if (!notes.empty()) {
        ss << " (";
        for (size_t i = 0; i < notes.size(); ++i) {
            if (i > 0) ss << "; ";
            ss << notes[i];
        }
        ss << ")";
    }
    return ss.str();
}

std::string MotorRegistry::renderManifest() const {
    std::string manifest;
    for (const auto& schema : schemas()) {
        manifest += RenderSchema(schema);
        manifest += "\n";
    }
    return manifest;
}

} // namespace psyche::application
