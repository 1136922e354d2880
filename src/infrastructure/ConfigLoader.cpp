/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace psyche::infrastructure {

using json = nlohmann::json;
using application::Millis;

namespace {

[[noreturn]] void Invalid(const std::string& key, const std::string& why) {
    throw std::runtime_error("[ConfigLoader] Invalid '" + key + "': " + why);
}

template <typename T>
T Read(const json& j, const std::string& key, const T& fallback, const std::string& scope) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        Invalid(scope + key, e.what());
    }
}

Millis ReadMillis(const json& j, const std::string& key, Millis fallback, const std::string& scope) {
    long long value = Read<long long>(j, key, fallback.count(), scope);
    if (value < 0) Invalid(scope + key, "must not be negative");
    return Millis(value);
}

const json& Section(const json& j, const std::string& key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return empty;
    if (!it->is_object()) Invalid(key, "expected an object");
    return *it;
}

domain::ImpressionLevel ReadLevel(const json& j, const std::string& key, domain::ImpressionLevel fallback,
                                  const std::string& scope) {
    std::string name = Read<std::string>(j, key, domain::LevelToString(fallback), scope);
    auto level = domain::LevelFromString(name);
    if (!level) Invalid(scope + key, "unknown level '" + name + "'");
    return *level;
}

std::string NormalizePath(std::string path) {
    if (!path.empty() && path.front() != '/') path.insert(path.begin(), '/');
    return path;
}

application::DistillerConfig ParseDistiller(const json& j, size_t index) {
    const std::string scope = "distillers[" + std::to_string(index) + "].";
    if (!j.is_object()) Invalid(scope, "expected an object");

    application::DistillerConfig d;
    d.name = Read<std::string>(j, "name", "", scope);
    if (d.name.empty()) Invalid(scope + "name", "is required");
    d.inputs = Read<std::vector<std::string>>(j, "inputs", {}, scope);
    if (d.inputs.empty()) Invalid(scope + "inputs", "needs at least one kind prefix");
    d.level = ReadLevel(j, "level", domain::ImpressionLevel::Instant, scope);
    d.prompt = Read<std::string>(j, "prompt", "", scope);
    if (d.prompt.empty()) d.prompt = PromptCatalog::GetDistillerPrompt(d.level);

    long long batch = Read<long long>(j, "batch_size", 1, scope);
    if (batch < 1) Invalid(scope + "batch_size", "must be at least 1");
    d.batchSize = static_cast<size_t>(batch);
    d.quiescence = ReadMillis(j, "quiescence_ms", Millis(0), scope);

    long long recall = Read<long long>(j, "recall_limit", 0, scope);
    if (recall < 0) Invalid(scope + "recall_limit", "must not be negative");
    d.recallLimit = static_cast<size_t>(recall);
    d.feedback = Read<std::string>(j, "feedback", "", scope);
    return d;
}

} // namespace

application::RuntimeConfig ConfigLoader::Defaults() {
    application::RuntimeConfig config;
    config.memoryDir = PathUtils::GetMemoryDir().string();
    config.socketPath = PathUtils::GetSocketPath().string();

    application::DistillerConfig quick;
    quick.name = "quick";
    quick.inputs = {"sensation"};
    quick.level = domain::ImpressionLevel::Instant;
    quick.prompt = PromptCatalog::GetDistillerPrompt(quick.level);
    quick.batchSize = 1;

    application::DistillerConfig combobulator;
    combobulator.name = "combobulator";
    combobulator.inputs = {"impression/instant"};
    combobulator.level = domain::ImpressionLevel::Situation;
    combobulator.prompt = PromptCatalog::GetDistillerPrompt(combobulator.level);
    combobulator.batchSize = 4;
    combobulator.quiescence = Millis(5000);
    combobulator.recallLimit = 3;

    config.distillers = {quick, combobulator};
    config.will.prompt = PromptCatalog::GetWillPrompt();
    return config;
}

application::RuntimeConfig ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) Invalid("<root>", "expected an object");

    application::RuntimeConfig config = Defaults();

    const json& identity = Section(j, "identity");
    auto& id = config.cognition.identity;
    id.name = Read<std::string>(identity, "name", id.name, "identity.");
    id.role = Read<std::string>(identity, "role", id.role, "identity.");
    id.purpose = Read<std::string>(identity, "purpose", id.purpose, "identity.");

    config.memoryDir = Read<std::string>(j, "memory_dir", config.memoryDir, "");
    config.durableWrites = Read<bool>(j, "durable_writes", config.durableWrites, "");
    config.dedupResolution = ReadMillis(j, "dedup_resolution_ms", config.dedupResolution, "");
    if (config.dedupResolution.count() == 0) Invalid("dedup_resolution_ms", "must be positive");
    config.socketPath = Read<std::string>(j, "socket_path", config.socketPath, "");

    const json& llm = Section(j, "llm");
    config.llm.host = Read<std::string>(llm, "host", config.llm.host, "llm.");
    config.llm.port = Read<int>(llm, "port", config.llm.port, "llm.");
    if (config.llm.port <= 0 || config.llm.port > 65535) Invalid("llm.port", "out of range");
    config.llm.model = Read<std::string>(llm, "model", config.llm.model, "llm.");
    config.llm.embeddingModel = Read<std::string>(llm, "embedding_model", config.llm.embeddingModel, "llm.");
    config.cognition.llmTimeout = ReadMillis(llm, "timeout_ms", config.cognition.llmTimeout, "llm.");

    if (j.contains("distillers")) {
        const json& list = j["distillers"];
        if (!list.is_array()) Invalid("distillers", "expected an array");
        config.distillers.clear();
        for (size_t i = 0; i < list.size(); ++i) {
            config.distillers.push_back(ParseDistiller(list[i], i));
        }
    }

    std::set<std::string> names;
    for (const auto& d : config.distillers) {
        if (d.name == "will" || d.name == "motors" || d.name == "ingress") {
            Invalid("distillers", "'" + d.name + "' is a reserved unit name");
        }
        if (!names.insert(d.name).second) Invalid("distillers", "duplicate name '" + d.name + "'");
    }
    for (const auto& d : config.distillers) {
        if (!d.feedback.empty() && names.count(d.feedback) == 0) {
            Invalid("distillers", "'" + d.name + "' feeds back to unknown distiller '" + d.feedback + "'");
        }
    }

    const json& will = Section(j, "will");
    config.will.level = ReadLevel(will, "decision_level", config.will.level, "will.");
    config.will.prompt = Read<std::string>(will, "prompt", config.will.prompt, "will.");
    if (config.will.prompt.empty()) config.will.prompt = PromptCatalog::GetWillPrompt();
    config.will.minInterval = ReadMillis(will, "min_interval_ms", config.will.minInterval, "will.");
    long long recall = Read<long long>(will, "recall_limit", static_cast<long long>(config.will.recallLimit), "will.");
    if (recall < 0) Invalid("will.recall_limit", "must not be negative");
    config.will.recallLimit = static_cast<size_t>(recall);
    config.will.thoughtPath = NormalizePath(Read<std::string>(will, "thought_path", config.will.thoughtPath, "will."));

    const json& retry = Section(j, "retry");
    config.cognition.retry.maxRetries = Read<int>(retry, "max_retries", config.cognition.retry.maxRetries, "retry.");
    if (config.cognition.retry.maxRetries < 0) Invalid("retry.max_retries", "must not be negative");
    config.cognition.retry.baseDelay = ReadMillis(retry, "base_delay_ms", config.cognition.retry.baseDelay, "retry.");
    config.cognition.retry.maxDelay = ReadMillis(retry, "max_delay_ms", config.cognition.retry.maxDelay, "retry.");

    const json& motors = Section(j, "motors");
    long long pending = Read<long long>(motors, "max_pending", static_cast<long long>(config.motors.maxPending), "motors.");
    if (pending < 1) Invalid("motors.max_pending", "must be at least 1");
    config.motors.maxPending = static_cast<size_t>(pending);
    config.motors.minDispatchInterval =
        ReadMillis(motors, "min_dispatch_interval_ms", config.motors.minDispatchInterval, "motors.");
    config.motors.actionTimeout = ReadMillis(motors, "action_timeout_ms", config.motors.actionTimeout, "motors.");
    config.motors.ttsUrl = Read<std::string>(motors, "tts_url", config.motors.ttsUrl, "motors.");
    config.motors.speakerId = Read<std::string>(motors, "speaker_id", config.motors.speakerId, "motors.");

    const json& supervisor = Section(j, "supervisor");
    config.supervisor.restartBase = ReadMillis(supervisor, "restart_base_ms", config.supervisor.restartBase, "supervisor.");
    config.supervisor.restartMax = ReadMillis(supervisor, "restart_max_ms", config.supervisor.restartMax, "supervisor.");
    config.supervisor.shutdownTimeout =
        ReadMillis(supervisor, "shutdown_timeout_ms", config.supervisor.shutdownTimeout, "supervisor.");
    config.supervisor.pinCores = Read<bool>(supervisor, "pin_cores", config.supervisor.pinCores, "supervisor.");

    config.cognition.healthFailureThreshold =
        Read<int>(j, "health_failure_threshold", config.cognition.healthFailureThreshold, "");
    if (config.cognition.healthFailureThreshold < 1) Invalid("health_failure_threshold", "must be at least 1");

    const json& log = Section(j, "log");
    config.cognition.verbose = Read<bool>(log, "verbose", config.cognition.verbose, "log.");

    return config;
}

application::RuntimeConfig ConfigLoader::Load(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No config at " << configPath << ", using defaults" << std::endl;
        return Defaults();
    }

    std::ifstream f(configPath);
    if (!f) {
        throw std::runtime_error("[ConfigLoader] Cannot open " + configPath.string());
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("[ConfigLoader] Error reading " + configPath.string() + ": " + e.what());
    }

    std::cout << "[ConfigLoader] Loaded " << configPath << std::endl;
    return FromJson(j);
}

} // namespace psyche::infrastructure
