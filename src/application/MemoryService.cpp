#include "application/MemoryService.hpp"
#include "domain/Identifiers.hpp"
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

namespace psyche::application {

using json = nlohmann::json;

MemoryService::MemoryService(std::shared_ptr<domain::MemoryRepository> repository,
                             std::chrono::milliseconds dedupResolution,
                             std::shared_ptr<EventBus> bus)
    : m_repository(std::move(repository)), m_dedupResolution(dedupResolution), m_bus(std::move(bus)) {
    if (m_dedupResolution.count() <= 0) m_dedupResolution = std::chrono::milliseconds(1);
}

std::string MemoryService::sensationDedupKey(const domain::Sensation& sensation) const {
    long long ms = domain::ToMillis(sensation.timestamp);
    long long rounded = (ms / m_dedupResolution.count()) * m_dedupResolution.count();
    return domain::ComputeHash(sensation.kind + "\n" + sensation.source + "\n" + sensation.text + "\n" + std::to_string(rounded));
}

domain::InsertOutcome MemoryService::recordSensation(domain::Sensation& sensation) {
    if (sensation.id.empty()) sensation.id = domain::GenerateId();

    domain::MemoryRecord record;
    record.id = sensation.id;
    record.kind = domain::kinds::Sensation;
    record.dedupKey = sensationDedupKey(sensation);
    record.text = sensation.text;
    record.timestamp = sensation.timestamp;
    record.dataJson = json{{"kind", sensation.kind}, {"source", sensation.source}}.dump();

    auto outcome = m_repository->insert(record);
    if (outcome == domain::InsertOutcome::Duplicate) {
        if (auto existing = m_repository->find(record.kind, record.dedupKey)) {
            sensation.id = *existing;
        }
    } else if (outcome == domain::InsertOutcome::WriteFailed) {
        reportFailure("sensation " + sensation.id);
    }
    return outcome;
}

bool MemoryService::recordImpression(const domain::Impression& impression) {
    if (impression.sourceIds.empty()) {
        std::cerr << "[MemoryService] Refusing impression " << impression.id << " without sources" << std::endl;
        return false;
    }

    domain::MemoryRecord record;
    record.id = impression.id;
    record.kind = domain::kinds::Impression;
    record.text = impression.text;
    record.timestamp = impression.timestamp;
    record.dataJson = json{
        {"level", domain::LevelToString(impression.level)},
        {"producer", impression.producer},
        {"sources", impression.sourceIds}
    }.dump();

    bool ok = store(record);
    for (const auto& source : impression.sourceIds) {
        ok = link(impression.id, domain::relations::Summarizes, source) && ok;
    }
    return ok;
}

bool MemoryService::recordFeedback(domain::Sensation& feedback, const std::string& impressionId) {
    auto outcome = recordSensation(feedback);
    if (outcome == domain::InsertOutcome::WriteFailed) return false;
    if (outcome == domain::InsertOutcome::Duplicate) return true;
    return link(feedback.id, domain::relations::DerivedFromFeedback, impressionId);
}

bool MemoryService::recordIntention(const domain::Intention& intention) {
    domain::MemoryRecord record;
    record.id = intention.id;
    record.kind = domain::kinds::Intention;
    record.text = intention.body;
    record.timestamp = intention.timestamp;
    record.dataJson = json{
        {"action", intention.action},
        {"attributes", intention.attributes},
        {"impression", intention.impressionId}
    }.dump();

    bool ok = store(record);
    if (!intention.impressionId.empty()) {
        ok = link(intention.id, domain::relations::MotivatedBy, intention.impressionId) && ok;
    }
    return ok;
}

bool MemoryService::recordMotorCall(const domain::MotorCall& call) {
    domain::MemoryRecord record;
    record.id = call.id;
    record.kind = domain::kinds::MotorCall;
    record.text = call.action;
    record.timestamp = call.started;
    record.dataJson = json{{"intention", call.intentionId}, {"action", call.action}}.dump();

    bool ok = store(record);
    return link(call.id, domain::relations::Executes, call.intentionId) && ok;
}

bool MemoryService::recordCompletion(const domain::Completion& completion) {
    domain::MemoryRecord record;
    record.id = completion.id;
    record.kind = domain::kinds::Completion;
    record.text = completion.result;
    record.timestamp = completion.timestamp;
    record.dataJson = json{{"motor_call", completion.motorCallId}, {"result", completion.result}}.dump();

    bool ok = store(record);
    return link(completion.id, domain::relations::Resolves, completion.motorCallId) && ok;
}

bool MemoryService::recordInterruption(const domain::Interruption& interruption) {
    domain::MemoryRecord record;
    record.id = interruption.id;
    record.kind = domain::kinds::Interruption;
    record.text = interruption.detail;
    record.timestamp = interruption.timestamp;
    record.dataJson = json{
        {"motor_call", interruption.motorCallId},
        {"cause", domain::CauseToString(interruption.cause)},
        {"detail", interruption.detail}
    }.dump();

    bool ok = store(record);
    return link(interruption.id, domain::relations::Resolves, interruption.motorCallId) && ok;
}

bool MemoryService::recordLifecycle(const domain::LifecycleEvent& event) {
    domain::MemoryRecord record;
    record.id = event.id;
    record.kind = domain::kinds::Lifecycle;
    record.text = event.detail;
    record.timestamp = event.timestamp;
    record.dataJson = json{
        {"unit", event.unit},
        {"event", domain::LifecycleKindToString(event.kind)},
        {"detail", event.detail}
    }.dump();
    return store(record);
}

std::vector<domain::RecallHit> MemoryService::recall(const std::string& query, size_t limit,
                                                     const std::vector<std::string>& excludeIds) const {
    if (limit == 0 || query.empty()) return {};

    auto hits = m_repository->recall(query, limit + excludeIds.size());
    hits.erase(std::remove_if(hits.begin(), hits.end(), [&excludeIds](const domain::RecallHit& hit) {
        return std::find(excludeIds.begin(), excludeIds.end(), hit.id) != excludeIds.end();
    }), hits.end());
    if (hits.size() > limit) hits.resize(limit);
    return hits;
}

std::vector<domain::Impression> MemoryService::impressions(std::optional<domain::ImpressionLevel> level) const {
    std::vector<domain::Impression> result;
    for (const auto& record : m_repository->ofKind(domain::kinds::Impression)) {
        try {
            auto data = json::parse(record.dataJson);
            auto parsedLevel = domain::LevelFromString(data.value("level", std::string("instant")));
            if (!parsedLevel) continue;
            if (level && *parsedLevel != *level) continue;

            domain::Impression imp;
            imp.id = record.id;
            imp.timestamp = record.timestamp;
            imp.level = *parsedLevel;
            imp.text = record.text;
            imp.producer = data.value("producer", std::string());
            imp.sourceIds = data.value("sources", std::vector<std::string>{});
            result.push_back(std::move(imp));
        } catch (const std::exception& e) {
            std::cerr << "[MemoryService] Corrupt impression " << record.id << ": " << e.what() << std::endl;
        }
    }
    std::sort(result.begin(), result.end(), [](const domain::Impression& a, const domain::Impression& b) {
        return a.timestamp < b.timestamp;
    });
    return result;
}

std::vector<domain::MemoryRecord> MemoryService::resolutionsOf(const std::string& motorCallId) const {
    std::vector<domain::MemoryRecord> result;
    for (const auto& edge : m_repository->linksTo(motorCallId, domain::relations::Resolves)) {
        if (auto record = m_repository->get(edge.from)) {
            result.push_back(*record);
        }
    }
    return result;
}

bool MemoryService::store(const domain::MemoryRecord& record) {
    auto outcome = m_repository->insert(record);
    if (outcome == domain::InsertOutcome::WriteFailed) {
        reportFailure(record.kind + " " + record.id);
        return false;
    }
    return true;
}

bool MemoryService::link(const std::string& from, const char* relation, const std::string& to) {
    if (m_repository->link(from, relation, to)) return true;
    reportFailure(std::string("link ") + relation + " " + from + " -> " + to);
    return false;
}

void MemoryService::reportFailure(const std::string& what) {
    std::cerr << "[MemoryService] ERROR: failed to persist " << what << std::endl;
    if (m_bus) m_bus->publish("health/degraded", "memory", "failed to persist " + what);
}

} // namespace psyche::application
