/**
 * @file MemoryRepository.hpp
 * @brief Interface for the durable entity and relationship store.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/Entities.hpp"

namespace psyche::domain {

/**
 * @struct MemoryRecord
 * @brief A stored entity. Typed attributes live in dataJson; text is what recall searches.
 */
struct MemoryRecord {
    std::string id;
    std::string kind;
    std::string dedupKey;
    std::string text;
    std::string dataJson = "{}";
    Timestamp timestamp;
};

struct MemoryLink {
    std::string from;
    std::string relation;
    std::string to;
};

struct RecallHit {
    std::string id;
    std::string text;
    float score = 0.0f;
};

enum class InsertOutcome {
    Inserted,
    Duplicate,
    WriteFailed
};

/**
 * @class MemoryRepository
 * @brief Insert-if-absent entity store with typed lookup, links and recall.
 *
 * Implementations must serialize concurrent inserts that target the same id or
 * the same (kind, dedupKey) pair, and must not block inserts of unrelated ids
 * on one another's I/O.
 */
class MemoryRepository {
public:
    virtual ~MemoryRepository() = default;

    /** @brief Looks up a record id by its dedup key within a kind. */
    virtual std::optional<std::string> find(const std::string& kind, const std::string& dedupKey) const = 0;

    /**
     * @brief Inserts the record unless its id or (kind, dedupKey) already exists.
     * @return Duplicate when nothing was written; WriteFailed when the durable write failed.
     */
    virtual InsertOutcome insert(const MemoryRecord& record) = 0;

    /** @brief Adds a directed edge. Edges are not checked for dangling ids. */
    virtual bool link(const std::string& from, const std::string& relation, const std::string& to) = 0;

    virtual std::optional<MemoryRecord> get(const std::string& id) const = 0;
    virtual std::vector<MemoryRecord> ofKind(const std::string& kind) const = 0;

    /** @brief Outgoing edges of a record, optionally filtered by relation. */
    virtual std::vector<MemoryLink> linksFrom(const std::string& id, const std::string& relation = "") const = 0;
    virtual std::vector<MemoryLink> linksTo(const std::string& id, const std::string& relation = "") const = 0;

    /** @brief Impressions most relevant to the query, best first. */
    virtual std::vector<RecallHit> recall(const std::string& query, size_t limit) const = 0;
};

} // namespace psyche::domain
