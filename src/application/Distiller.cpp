#include "application/Distiller.hpp"
#include "application/PromptAssembler.hpp"
#include "domain/Identifiers.hpp"
#include <iostream>
#include <stdexcept>

namespace psyche::application {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(100);
}

Distiller::Distiller(DistillerConfig config,
                     std::shared_ptr<Router> router,
                     CognitionSettings cognition,
                     std::shared_ptr<EventBus> bus)
    : m_config(std::move(config)),
      m_router(std::move(router)),
      m_cognition(std::move(cognition)),
      m_bus(std::move(bus)) {
    if (m_config.name.empty()) {
        throw std::invalid_argument("Distiller needs a name");
    }
    if (m_config.batchSize == 0) m_config.batchSize = 1;
    m_input = m_router->queueFor(m_config.name);
}

void Distiller::run(UnitContext& context, CancellationToken& token) {
    if (!context.ai) {
        throw std::runtime_error(tag() + " started without a language model");
    }

    std::vector<domain::Percept> window;
    auto lastDistillation = std::chrono::steady_clock::now();

    while (!token.isCancelled()) {
        if (auto item = m_input->popFor(kPollInterval)) {
            if (m_cognition.verbose) {
                std::cout << tag() << " <- " << item->kind << ": " << item->text << std::endl;
            }
            window.push_back(std::move(*item));
        }
        if (window.empty()) continue;

        auto now = std::chrono::steady_clock::now();
        bool full = window.size() >= m_config.batchSize;
        bool quiet = m_config.quiescence.count() > 0 && now - lastDistillation >= m_config.quiescence;
        if (!full && !quiet) continue;

        std::vector<domain::Percept> batch;
        batch.swap(window);
        distill(batch, context, token);
        lastDistillation = std::chrono::steady_clock::now();
    }
}

std::optional<domain::Impression> Distiller::distill(const std::vector<domain::Percept>& window,
                                                     UnitContext& context,
                                                     const CancellationToken& token) {
    if (window.empty()) return std::nullopt;

    PromptBundle bundle;
    bundle.identity = m_cognition.identity.render();
    bundle.instruction = m_config.prompt;
    bundle.items = window;

    std::vector<std::string> sourceIds;
    std::string query;
    for (const auto& item : window) {
        sourceIds.push_back(item.id);
        if (!query.empty()) query += "\n";
        query += item.text;
    }

    if (m_config.recallLimit > 0 && context.memory) {
        bundle.memories = context.memory->recall(query, m_config.recallLimit, sourceIds);
    }

    auto messages = PromptAssembler::BuildDistillation(bundle);

    std::string output;
    bool ok = m_cognition.retry.run([&](int) {
        output.clear();
        bool timedOut = false;
        auto deadline = std::chrono::steady_clock::now() + m_cognition.llmTimeout;
        bool streamed = context.ai->streamChat(messages, [&](const std::string& piece) {
            if (token.isCancelled()) return false;
            if (std::chrono::steady_clock::now() > deadline) {
                timedOut = true;
                return false;
            }
            output += piece;
            return true;
        });
        if (timedOut) {
            std::cerr << tag() << " Model call exceeded " << m_cognition.llmTimeout.count() << "ms" << std::endl;
            return false;
        }
        if (!streamed) return false;
        if (domain::Trim(output).empty()) {
            std::cerr << tag() << " Model returned an empty summary" << std::endl;
            return false;
        }
        return true;
    }, token, tag());

    if (!ok) {
        if (token.isCancelled()) return std::nullopt;
        ++m_consecutiveFailures;
        std::cerr << tag() << " Dropping window of " << window.size() << " item(s) after "
                  << (m_cognition.retry.maxRetries + 1) << " attempt(s)" << std::endl;
        if (m_bus && m_consecutiveFailures == m_cognition.healthFailureThreshold) {
            m_bus->publish("health/degraded", name(),
                           std::to_string(m_consecutiveFailures) + " consecutive windows dropped");
        }
        return std::nullopt;
    }
    m_consecutiveFailures = 0;

    domain::Impression impression;
    impression.id = domain::GenerateId();
    impression.timestamp = domain::Clock::now();
    impression.level = m_config.level;
    impression.text = domain::Trim(output);
    impression.sourceIds = sourceIds;
    impression.producer = m_config.name;

    if (context.memory) {
        context.memory->recordImpression(impression);
    }

    std::cout << tag() << " " << domain::LevelToString(impression.level) << ": " << impression.text << std::endl;
    if (m_bus) {
        m_bus->publish("impression/" + domain::LevelToString(impression.level), name(), impression.text);
    }

    m_router->route(domain::Percept::FromImpression(impression));
    if (!m_config.feedback.empty()) {
        deliverFeedback(impression, context);
    }
    return impression;
}

void Distiller::deliverFeedback(const domain::Impression& impression, UnitContext& context) {
    domain::Sensation feedback;
    feedback.timestamp = impression.timestamp;
    feedback.kind = "feedback/" + domain::LevelToString(impression.level);
    feedback.source = m_config.name;
    feedback.text = impression.text;

    if (context.memory) {
        context.memory->recordFeedback(feedback, impression.id);
    } else {
        feedback.id = domain::GenerateId();
    }
    m_router->deliver(m_config.feedback, domain::Percept::FromSensation(feedback));
}

} // namespace psyche::application
