/**
 * @file RuntimeConfig.hpp
 * @brief Settings for every unit of the runtime, with the defaults of a two-stage pipeline.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "application/RetryPolicy.hpp"
#include "domain/Entities.hpp"

namespace psyche::application {

using Millis = std::chrono::milliseconds;

struct Identity {
    std::string name = "Psyche";
    std::string role = "An embodied agent";
    std::string purpose = "To notice what happens around it and respond";

    std::string render() const {
        return "You are " + name + ". " + role + ". " + purpose + ".";
    }
};

/** @brief Settings shared by the language-model driven units. */
struct CognitionSettings {
    Identity identity;
    RetryPolicy retry;
    Millis llmTimeout{60000};
    /** Consecutive dropped cycles before "health/degraded" is published. */
    int healthFailureThreshold = 3;
    bool verbose = false;
};

struct DistillerConfig {
    std::string name;
    /** Kind prefixes this distiller listens to, e.g. "sensation" or "impression/instant". */
    std::vector<std::string> inputs;
    domain::ImpressionLevel level = domain::ImpressionLevel::Instant;
    /** Empty selects the default instruction for the level. */
    std::string prompt;
    size_t batchSize = 1;
    /** 0 disables the time trigger. */
    Millis quiescence{0};
    size_t recallLimit = 0;
    /** Name of the distiller that receives produced impressions again, empty for none. */
    std::string feedback;
};

struct DecisionConfig {
    domain::ImpressionLevel level = domain::ImpressionLevel::Situation;
    std::string prompt;
    Millis minInterval{10000};
    size_t recallLimit = 3;
    /** Ingress path for thoughts, e.g. "/thought". Empty keeps thoughts off the pipeline. */
    std::string thoughtPath = "/thought";
};

struct MotorSettings {
    size_t maxPending = 32;
    Millis minDispatchInterval{0};
    Millis actionTimeout{30000};
    std::string ttsUrl;
    std::string speakerId = "p300";
};

struct SupervisorSettings {
    Millis restartBase{100};
    Millis restartMax{10000};
    Millis shutdownTimeout{3000};
    bool pinCores = false;
};

struct LlmSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model;
    std::string embeddingModel;
};

struct RuntimeConfig {
    std::string memoryDir;
    bool durableWrites = false;
    Millis dedupResolution{1000};
    std::string socketPath;
    LlmSettings llm;
    CognitionSettings cognition;
    std::vector<DistillerConfig> distillers;
    DecisionConfig will;
    MotorSettings motors;
    SupervisorSettings supervisor;
};

} // namespace psyche::application
