/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the runtime configuration (config.json).
 *
 * Keeps JSON parsing in one place; the rest of the codebase only sees
 * application::RuntimeConfig.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "application/RuntimeConfig.hpp"

namespace psyche::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads the configuration file.
     * @param path File to read. A missing file yields Defaults().
     * @throws std::runtime_error on malformed JSON or invalid values, naming the key.
     */
    static application::RuntimeConfig Load(const std::string& path);

    /** @brief Two-stage pipeline (quick -> combobulator) with XDG directories. */
    static application::RuntimeConfig Defaults();

    /** @brief Applies the keys present in `j` over Defaults(). */
    static application::RuntimeConfig FromJson(const nlohmann::json& j);
};

} // namespace psyche::infrastructure
