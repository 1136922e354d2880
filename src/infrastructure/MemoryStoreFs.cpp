/**
 * @file MemoryStoreFs.cpp
 * @brief Implementation of MemoryStoreFs.
 */

#include "infrastructure/MemoryStoreFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "domain/Identifiers.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace psyche::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
constexpr size_t kEmbeddingFlushEvery = 16;

std::string DedupIndexKey(const std::string& kind, const std::string& dedupKey) {
    return kind + '\x1f' + dedupKey;
}

std::set<std::string> Words(const std::string& text) {
    std::set<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            if (current.size() > 2) words.insert(current);
            current.clear();
        }
    }
    if (current.size() > 2) words.insert(current);
    return words;
}

std::string EncodeRecord(const domain::MemoryRecord& record) {
    json j;
    j["op"] = "insert";
    j["id"] = record.id;
    j["kind"] = record.kind;
    j["dedup"] = record.dedupKey;
    j["text"] = record.text;
    try {
        j["data"] = json::parse(record.dataJson);
    } catch (const std::exception&) {
        j["data"] = record.dataJson;
    }
    j["ts"] = domain::ToMillis(record.timestamp);
    return j.dump() + "\n";
}

std::string EncodeLink(const domain::MemoryLink& link) {
    json j;
    j["op"] = "link";
    j["from"] = link.from;
    j["rel"] = link.relation;
    j["to"] = link.to;
    j["ts"] = domain::ToMillis(domain::Clock::now());
    return j.dump() + "\n";
}

std::vector<domain::MemoryLink> Filter(const std::vector<domain::MemoryLink>& links, const std::string& relation) {
    if (relation.empty()) return links;
    std::vector<domain::MemoryLink> result;
    for (const auto& link : links) {
        if (link.relation == relation) result.push_back(link);
    }
    return result;
}
}

MemoryStoreFs::MemoryStoreFs(std::string directory, std::shared_ptr<PersistenceService> persistence, bool durable)
    : m_directory(std::move(directory)),
      m_persistence(std::move(persistence)),
      m_durable(durable),
      m_embeddings(m_directory, m_persistence) {}

void MemoryStoreFs::setEmbedder(Embedder embedder) {
    m_embedder = std::move(embedder);
}

void MemoryStoreFs::setFailureHandler(FailureHandler handler) {
    m_onFailure = std::move(handler);
}

std::string MemoryStoreFs::logPath() const {
    return (fs::path(m_directory) / "memory.ndjson").string();
}

std::mutex& MemoryStoreFs::stripeFor(const std::string& key) {
    return m_stripes[std::hash<std::string>{}(key) % kStripes];
}

size_t MemoryStoreFs::load() {
    if (m_directory.empty()) return 0;
    m_embeddings.load();

    std::ifstream in(logPath());
    if (!in.is_open()) return 0;

    size_t loaded = 0;
    size_t skipped = 0;
    std::string line;
    std::unique_lock<std::shared_mutex> lock(m_indexMutex);
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            std::string op = j.value("op", std::string());
            if (op == "insert") {
                domain::MemoryRecord record;
                record.id = j.at("id").get<std::string>();
                record.kind = j.at("kind").get<std::string>();
                record.dedupKey = j.value("dedup", std::string());
                record.text = j.value("text", std::string());
                record.dataJson = j.contains("data") ? j["data"].dump() : "{}";
                record.timestamp = domain::FromMillis(j.value("ts", 0LL));
                if (m_records.count(record.id)) continue;
                indexRecord(record);
                ++loaded;
            } else if (op == "link") {
                indexLink(domain::MemoryLink{j.at("from").get<std::string>(),
                                             j.at("rel").get<std::string>(),
                                             j.at("to").get<std::string>()});
            } else {
                ++skipped;
            }
        } catch (const std::exception&) {
            ++skipped; // Ignore malformed lines
        }
    }

    std::cout << "[MemoryStore] Loaded " << loaded << " records from " << logPath();
    if (skipped > 0) std::cout << " (" << skipped << " unreadable lines skipped)";
    std::cout << std::endl;
    return loaded;
}

void MemoryStoreFs::flush() {
    if (m_embeddings.size() > 0) m_embeddings.persist();
    m_embeddedSinceFlush = 0;
}

bool MemoryStoreFs::writeLine(const std::string& line) {
    if (m_directory.empty() || !m_persistence) return true;

    if (m_durable) {
        if (m_persistence->appendText(logPath(), line)) return true;
        std::cerr << "[MemoryStore] ERROR: durable write to " << logPath() << " failed" << std::endl;
        if (m_onFailure) m_onFailure(logPath());
        return false;
    }

    auto onFailure = m_onFailure;
    m_persistence->appendTextAsync(logPath(), line, [onFailure](const std::string& file) {
        std::cerr << "[MemoryStore] ERROR: write to " << file << " failed, keeping in-memory copy" << std::endl;
        if (onFailure) onFailure(file);
    });
    return true;
}

domain::InsertOutcome MemoryStoreFs::insert(const domain::MemoryRecord& record) {
    if (record.id.empty() || record.kind.empty()) {
        throw std::invalid_argument("MemoryStoreFs::insert: record needs an id and a kind");
    }

    const std::string stripeKey = record.dedupKey.empty() ? record.id : DedupIndexKey(record.kind, record.dedupKey);
    std::lock_guard<std::mutex> stripe(stripeFor(stripeKey));

    {
        std::shared_lock<std::shared_mutex> lock(m_indexMutex);
        if (m_records.count(record.id)) return domain::InsertOutcome::Duplicate;
        if (!record.dedupKey.empty() && m_dedup.count(DedupIndexKey(record.kind, record.dedupKey))) {
            return domain::InsertOutcome::Duplicate;
        }
    }

    if (!writeLine(EncodeRecord(record))) return domain::InsertOutcome::WriteFailed;

    {
        std::unique_lock<std::shared_mutex> lock(m_indexMutex);
        indexRecord(record);
    }

    if (record.kind == domain::kinds::Impression) embed(record);
    return domain::InsertOutcome::Inserted;
}

bool MemoryStoreFs::link(const std::string& from, const std::string& relation, const std::string& to) {
    if (from.empty() || relation.empty() || to.empty()) {
        std::cerr << "[MemoryStore] Ignoring incomplete link " << from << " -" << relation << "-> " << to << std::endl;
        return false;
    }

    domain::MemoryLink edge{from, relation, to};
    {
        std::shared_lock<std::shared_mutex> lock(m_indexMutex);
        auto it = m_linksOut.find(from);
        if (it != m_linksOut.end()) {
            for (const auto& existing : it->second) {
                if (existing.relation == relation && existing.to == to) return true;
            }
        }
    }

    if (!writeLine(EncodeLink(edge))) return false;

    std::unique_lock<std::shared_mutex> lock(m_indexMutex);
    indexLink(edge);
    return true;
}

void MemoryStoreFs::indexRecord(const domain::MemoryRecord& record) {
    m_records[record.id] = record;
    m_byKind[record.kind].push_back(record.id);
    if (!record.dedupKey.empty()) {
        m_dedup.emplace(DedupIndexKey(record.kind, record.dedupKey), record.id);
    }
}

void MemoryStoreFs::indexLink(const domain::MemoryLink& link) {
    auto& out = m_linksOut[link.from];
    for (const auto& existing : out) {
        if (existing.relation == link.relation && existing.to == link.to) return;
    }
    out.push_back(link);
    m_linksIn[link.to].push_back(link);
}

void MemoryStoreFs::embed(const domain::MemoryRecord& record) {
    if (!m_embedder || record.text.empty()) return;

    std::string hash = domain::ComputeHash(record.text);
    if (m_embeddings.get(record.id, hash)) return;

    auto vec = m_embedder(record.text);
    if (vec.empty()) return;
    m_embeddings.update(record.id, hash, vec);

    if (++m_embeddedSinceFlush >= kEmbeddingFlushEvery) {
        flush();
    }
}

std::optional<std::string> MemoryStoreFs::find(const std::string& kind, const std::string& dedupKey) const {
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_dedup.find(DedupIndexKey(kind, dedupKey));
    if (it == m_dedup.end()) return std::nullopt;
    return it->second;
}

std::optional<domain::MemoryRecord> MemoryStoreFs::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) return std::nullopt;
    return it->second;
}

std::vector<domain::MemoryRecord> MemoryStoreFs::ofKind(const std::string& kind) const {
    std::vector<domain::MemoryRecord> result;
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_byKind.find(kind);
    if (it == m_byKind.end()) return result;
    result.reserve(it->second.size());
    for (const auto& id : it->second) {
        result.push_back(m_records.at(id));
    }
    return result;
}

std::vector<domain::MemoryLink> MemoryStoreFs::linksFrom(const std::string& id, const std::string& relation) const {
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_linksOut.find(id);
    if (it == m_linksOut.end()) return {};
    return Filter(it->second, relation);
}

std::vector<domain::MemoryLink> MemoryStoreFs::linksTo(const std::string& id, const std::string& relation) const {
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_linksIn.find(id);
    if (it == m_linksIn.end()) return {};
    return Filter(it->second, relation);
}

size_t MemoryStoreFs::size() const {
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    return m_records.size();
}

std::vector<domain::RecallHit> MemoryStoreFs::recall(const std::string& query, size_t limit) const {
    if (limit == 0 || query.empty()) return {};

    if (m_embedder && m_embeddings.size() > 0) {
        auto queryVec = m_embedder(query);
        if (!queryVec.empty()) {
            std::vector<domain::RecallHit> hits;
            for (const auto& [id, score] : m_embeddings.nearest(queryVec, limit)) {
                if (auto record = get(id)) {
                    hits.push_back(domain::RecallHit{id, record->text, score});
                }
            }
            if (!hits.empty()) return hits;
        }
    }
    return lexicalRecall(query, limit);
}

std::vector<domain::RecallHit> MemoryStoreFs::lexicalRecall(const std::string& query, size_t limit) const {
    auto queryWords = Words(query);
    if (queryWords.empty()) return {};

    struct Scored {
        domain::RecallHit hit;
        domain::Timestamp ts;
    };
    std::vector<Scored> scored;
    for (const auto& record : ofKind(domain::kinds::Impression)) {
        auto words = Words(record.text);
        if (words.empty()) continue;
        size_t shared = 0;
        for (const auto& w : words) shared += queryWords.count(w);
        if (shared == 0) continue;
        float score = static_cast<float>(shared) /
                      std::sqrt(static_cast<float>(words.size()) * static_cast<float>(queryWords.size()));
        scored.push_back(Scored{domain::RecallHit{record.id, record.text, score}, record.timestamp});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.hit.score != b.hit.score) return a.hit.score > b.hit.score;
        return a.ts > b.ts;
    });

    std::vector<domain::RecallHit> hits;
    for (size_t i = 0; i < scored.size() && i < limit; ++i) {
        hits.push_back(scored[i].hit);
    }
    return hits;
}

} // namespace psyche::infrastructure
