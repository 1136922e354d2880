/**
 * @file MemoryService.hpp
 * @brief Typed facade over the memory repository: dedup, lineage links and recall.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/EventBus.hpp"
#include "domain/Entities.hpp"
#include "domain/MemoryRepository.hpp"

namespace psyche::application {

/**
 * @class MemoryService
 * @brief Per-unit memory handle. Many instances may share one repository.
 *
 * Write failures are logged and published as "health/degraded"; callers keep
 * going with the in-memory effect.
 */
class MemoryService {
public:
    MemoryService(std::shared_ptr<domain::MemoryRepository> repository,
                  std::chrono::milliseconds dedupResolution = std::chrono::milliseconds(1000),
                  std::shared_ptr<EventBus> bus = nullptr);

    /**
     * @brief Stores a sensation unless an identical one (kind, source, text,
     *        rounded timestamp) already exists.
     *
     * Assigns an id when empty. On Duplicate, sensation.id is replaced by the
     * id of the stored original.
     */
    domain::InsertOutcome recordSensation(domain::Sensation& sensation);

    /** @brief Stores the impression with a SUMMARIZES edge to every source. Rejects empty lineage. */
    bool recordImpression(const domain::Impression& impression);

    /** @brief Stores a feedback sensation derived from an impression. */
    bool recordFeedback(domain::Sensation& feedback, const std::string& impressionId);

    bool recordIntention(const domain::Intention& intention);
    bool recordMotorCall(const domain::MotorCall& call);
    bool recordCompletion(const domain::Completion& completion);
    bool recordInterruption(const domain::Interruption& interruption);
    bool recordLifecycle(const domain::LifecycleEvent& event);

    /** @brief Related impressions, excluding the given ids. */
    std::vector<domain::RecallHit> recall(const std::string& query, size_t limit,
                                          const std::vector<std::string>& excludeIds = {}) const;

    /** @brief Stored impressions, optionally of one level, oldest first. */
    std::vector<domain::Impression> impressions(std::optional<domain::ImpressionLevel> level = std::nullopt) const;

    /** @brief Completion and Interruption records resolving a MotorCall. */
    std::vector<domain::MemoryRecord> resolutionsOf(const std::string& motorCallId) const;

    std::string sensationDedupKey(const domain::Sensation& sensation) const;

    std::shared_ptr<domain::MemoryRepository> repository() const { return m_repository; }

private:
    bool store(const domain::MemoryRecord& record);
    bool link(const std::string& from, const char* relation, const std::string& to);
    void reportFailure(const std::string& what);

    std::shared_ptr<domain::MemoryRepository> m_repository;
    std::chrono::milliseconds m_dedupResolution;
    std::shared_ptr<EventBus> m_bus;
};

} // namespace psyche::application
