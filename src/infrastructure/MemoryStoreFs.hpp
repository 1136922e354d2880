/**
 * @file MemoryStoreFs.hpp
 * @brief MemoryRepository backed by an in-memory index and an append-only NDJSON log.
 */

#pragma once

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/MemoryRepository.hpp"
#include "infrastructure/EmbeddingIndex.hpp"

namespace psyche::infrastructure {

class PersistenceService;

/**
 * @class MemoryStoreFs
 * @brief Shared store for every unit.
 *
 * Layout: <directory>/memory.ndjson holds one JSON object per line, either
 * {"op":"insert",...} or {"op":"link",...}. The log is replayed by load().
 * An empty directory keeps everything in memory.
 *
 * Inserts of the same id or dedup key serialize on one of kStripes mutexes;
 * the shared index lock is only held for map updates, never across I/O.
 */
class MemoryStoreFs : public domain::MemoryRepository {
public:
    using Embedder = std::function<std::vector<float>(const std::string&)>;
    using FailureHandler = std::function<void(const std::string&)>;

    /**
     * @param directory Memory directory (created on first write).
     * @param persistence Serialized writer shared with other file users.
     * @param durable When true, insert() waits for the log write and reports failures.
     */
    MemoryStoreFs(std::string directory, std::shared_ptr<PersistenceService> persistence, bool durable = false);

    /** @brief Replays the log and embedding index. Returns the number of records loaded. */
    size_t load();

    /** @brief Enables semantic recall. Without it recall falls back to word overlap. */
    void setEmbedder(Embedder embedder);

    /** @brief Called on every failed write, including best-effort ones. */
    void setFailureHandler(FailureHandler handler);

    /** @brief Writes the embedding index snapshot. */
    void flush();

    std::optional<std::string> find(const std::string& kind, const std::string& dedupKey) const override;
    domain::InsertOutcome insert(const domain::MemoryRecord& record) override;
    bool link(const std::string& from, const std::string& relation, const std::string& to) override;
    std::optional<domain::MemoryRecord> get(const std::string& id) const override;
    std::vector<domain::MemoryRecord> ofKind(const std::string& kind) const override;
    std::vector<domain::MemoryLink> linksFrom(const std::string& id, const std::string& relation = "") const override;
    std::vector<domain::MemoryLink> linksTo(const std::string& id, const std::string& relation = "") const override;
    std::vector<domain::RecallHit> recall(const std::string& query, size_t limit) const override;

    size_t size() const;

private:
    static constexpr size_t kStripes = 64;

    std::mutex& stripeFor(const std::string& key);
    std::string logPath() const;
    bool writeLine(const std::string& line);
    void indexRecord(const domain::MemoryRecord& record);
    void indexLink(const domain::MemoryLink& link);
    void embed(const domain::MemoryRecord& record);
    std::vector<domain::RecallHit> lexicalRecall(const std::string& query, size_t limit) const;

    std::string m_directory;
    std::shared_ptr<PersistenceService> m_persistence;
    bool m_durable;
    EmbeddingIndex m_embeddings;
    Embedder m_embedder;
    FailureHandler m_onFailure;

    mutable std::shared_mutex m_indexMutex;
    std::unordered_map<std::string, domain::MemoryRecord> m_records;
    std::unordered_map<std::string, std::string> m_dedup;
    std::unordered_map<std::string, std::vector<std::string>> m_byKind;
    std::unordered_map<std::string, std::vector<domain::MemoryLink>> m_linksOut;
    std::unordered_map<std::string, std::vector<domain::MemoryLink>> m_linksIn;

    std::array<std::mutex, kStripes> m_stripes;
    std::atomic<size_t> m_embeddedSinceFlush{0};
};

} // namespace psyche::infrastructure
