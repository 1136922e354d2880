/**
 * @file EmbeddingIndex.hpp
 * @brief Persistent embedding vectors for semantic recall over impressions.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace psyche::infrastructure {

class PersistenceService;

/**
 * @class EmbeddingIndex
 * @brief Caches one embedding per record so recall never recomputes stored vectors.
 */
class EmbeddingIndex {
public:
    EmbeddingIndex(const std::string& directory, std::shared_ptr<PersistenceService> persistence);

    /** @brief Updates or adds an embedding. */
    void update(const std::string& id, const std::string& contentHash, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding if the hash matches. */
    std::optional<std::vector<float>> get(const std::string& id, const std::string& contentHash) const;

    /** @brief Best matches by cosine similarity, highest first. */
    std::vector<std::pair<std::string, float>> nearest(const std::vector<float>& query, size_t limit) const;

    size_t size() const;

    /** @brief Saves the index to .embeddings.json in the memory directory. */
    void persist();

    /** @brief Loads the index from disk. */
    void load();

    static float CosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2);

private:
    std::string m_directory;
    std::shared_ptr<PersistenceService> m_persistence;
    struct Entry {
        std::string hash;
        std::vector<float> vector;
    };
    std::map<std::string, Entry> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace psyche::infrastructure
