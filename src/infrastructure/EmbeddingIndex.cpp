/**
 * @file EmbeddingIndex.cpp
 * @brief Implementation of EmbeddingIndex.
 */

#include "infrastructure/EmbeddingIndex.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace psyche::infrastructure {

EmbeddingIndex::EmbeddingIndex(const std::string& directory, std::shared_ptr<PersistenceService> persistence)
    : m_directory(directory), m_persistence(std::move(persistence)) {}

void EmbeddingIndex::update(const std::string& id, const std::string& contentHash, const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[id] = {contentHash, embedding};
}

std::optional<std::vector<float>> EmbeddingIndex::get(const std::string& id, const std::string& contentHash) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it != m_entries.end() && it->second.hash == contentHash) {
        return it->second.vector;
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, float>> EmbeddingIndex::nearest(const std::vector<float>& query, size_t limit) const {
    std::vector<std::pair<std::string, float>> scored;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            float sim = CosineSimilarity(query, entry.vector);
            if (sim > 0.0f) scored.emplace_back(id, sim);
        }
    }
    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    if (scored.size() > limit) scored.resize(limit);
    return scored;
}

size_t EmbeddingIndex::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void EmbeddingIndex::persist() {
    if (m_directory.empty()) return;
    fs::path p = fs::path(m_directory) / ".embeddings.json";

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            j[id] = { {"hash", entry.hash}, {"vector", entry.vector} };
        }
    }

    if (m_persistence) {
        m_persistence->saveTextAsync(p.string(), j.dump());
    }
}

void EmbeddingIndex::load() {
    if (m_directory.empty()) return;
    fs::path p = fs::path(m_directory) / ".embeddings.json";
    if (!fs::exists(p)) return;

    try {
        std::ifstream f(p);
        if (!f.is_open()) return;

        json j = json::parse(f);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().contains("hash") && it.value().contains("vector")) {
                std::string hash = it.value()["hash"];
                std::vector<float> vec = it.value()["vector"];
                m_entries[it.key()] = {hash, vec};
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[EmbeddingIndex] Ignoring unreadable " << p << ": " << e.what() << std::endl;
    }
}

float EmbeddingIndex::CosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0f;
    float dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += v1[i] * v2[i];
        n1 += v1[i] * v1[i];
        n2 += v2[i] * v2[i];
    }
    float norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0f;
}

} // namespace psyche::infrastructure
