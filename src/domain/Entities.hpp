/**
 * @file Entities.hpp
 * @brief Core cognitive entities: sensations, impressions and the action audit trail.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace psyche::domain {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @enum ImpressionLevel
 * @brief Abstraction level of an impression. Ordered from lowest to highest.
 */
enum class ImpressionLevel {
    Instant = 0,
    Situation,
    Episode,
    Narrative
};

inline std::string LevelToString(ImpressionLevel level) {
    switch (level) {
        case ImpressionLevel::Instant: return "instant";
        case ImpressionLevel::Situation: return "situation";
        case ImpressionLevel::Episode: return "episode";
        case ImpressionLevel::Narrative: return "narrative";
    }
    return "instant";
}

inline std::optional<ImpressionLevel> LevelFromString(const std::string& name) {
    if (name == "instant") return ImpressionLevel::Instant;
    if (name == "situation") return ImpressionLevel::Situation;
    if (name == "episode") return ImpressionLevel::Episode;
    if (name == "narrative") return ImpressionLevel::Narrative;
    return std::nullopt;
}

/**
 * @struct Sensation
 * @brief One atomic unit of raw experience.
 *
 * The kind names the modality as a path (e.g. "sensation/chat"); source names
 * the device or adapter that produced it.
 */
struct Sensation {
    std::string id;
    Timestamp timestamp;
    std::string kind;
    std::string source;
    std::string text;
};

/**
 * @struct Impression
 * @brief A first-person summary over one or more sources.
 */
struct Impression {
    std::string id;
    Timestamp timestamp;
    ImpressionLevel level = ImpressionLevel::Instant;
    std::string text;
    std::vector<std::string> sourceIds;
    std::string producer;
};

/**
 * @struct Percept
 * @brief What travels between units: a view over a stored Sensation or Impression.
 */
struct Percept {
    std::string id;
    std::string kind;
    std::string source;
    std::string text;
    Timestamp timestamp;

    static Percept FromSensation(const Sensation& s) {
        return Percept{s.id, s.kind, s.source, s.text, s.timestamp};
    }

    static Percept FromImpression(const Impression& imp) {
        return Percept{imp.id, "impression/" + LevelToString(imp.level), imp.producer, imp.text, imp.timestamp};
    }
};

/**
 * @struct Intention
 * @brief A parsed, not yet executed action request.
 */
struct Intention {
    std::string id;
    std::string action;
    std::map<std::string, std::string> attributes;
    std::string body;
    Timestamp timestamp;
    std::string impressionId;
};

/** @brief Audit record of an action invocation that began executing. */
struct MotorCall {
    std::string id;
    std::string intentionId;
    std::string action;
    Timestamp started;
};

struct Completion {
    std::string id;
    std::string motorCallId;
    std::string result;
    Timestamp timestamp;
};

enum class InterruptionCause {
    Superseded,
    Error,
    Cancelled
};

inline std::string CauseToString(InterruptionCause cause) {
    switch (cause) {
        case InterruptionCause::Superseded: return "superseded";
        case InterruptionCause::Error: return "error";
        case InterruptionCause::Cancelled: return "cancelled";
    }
    return "error";
}

struct Interruption {
    std::string id;
    std::string motorCallId;
    InterruptionCause cause = InterruptionCause::Error;
    std::string detail;
    Timestamp timestamp;
};

/**
 * @struct MotorOutcome
 * @brief Terminal state of a MotorCall. Exactly one of the two members is set.
 */
struct MotorOutcome {
    MotorCall call;
    std::optional<Completion> completion;
    std::optional<Interruption> interruption;

    bool completed() const { return completion.has_value(); }
};

enum class LifecycleKind {
    Started,
    Restarted,
    Crashed,
    Exited,
    Stopped,
    Terminated
};

inline std::string LifecycleKindToString(LifecycleKind kind) {
    switch (kind) {
        case LifecycleKind::Started: return "started";
        case LifecycleKind::Restarted: return "restarted";
        case LifecycleKind::Crashed: return "crashed";
        case LifecycleKind::Exited: return "exited";
        case LifecycleKind::Stopped: return "stopped";
        case LifecycleKind::Terminated: return "terminated";
    }
    return "started";
}

struct LifecycleEvent {
    std::string id;
    std::string unit;
    LifecycleKind kind = LifecycleKind::Started;
    std::string detail;
    Timestamp timestamp;
};

/** @brief Record kinds used by the memory layer. */
namespace kinds {
inline constexpr const char* Sensation = "sensation";
inline constexpr const char* Impression = "impression";
inline constexpr const char* Intention = "intention";
inline constexpr const char* MotorCall = "motor_call";
inline constexpr const char* Completion = "completion";
inline constexpr const char* Interruption = "interruption";
inline constexpr const char* Lifecycle = "lifecycle";
} // namespace kinds

/** @brief Relationship names between stored records. */
namespace relations {
inline constexpr const char* Summarizes = "SUMMARIZES";
inline constexpr const char* DerivedFromFeedback = "DERIVED_FROM_FEEDBACK";
inline constexpr const char* MotivatedBy = "MOTIVATED_BY";
inline constexpr const char* Executes = "EXECUTES";
inline constexpr const char* Resolves = "RESOLVES";
} // namespace relations

} // namespace psyche::domain
