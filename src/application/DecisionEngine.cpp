/**
 * @file DecisionEngine.cpp
 * @brief Implementation of the DecisionEngine.
 */

#include "application/DecisionEngine.hpp"
#include "application/PromptAssembler.hpp"
#include "domain/Identifiers.hpp"
#include "domain/StreamingTagParser.hpp"
#include <iostream>
#include <stdexcept>

namespace psyche::application {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(100);
}

DecisionEngine::DecisionEngine(DecisionConfig config,
                               std::shared_ptr<Router> router,
                               std::shared_ptr<MotorExecutor> executor,
                               CognitionSettings cognition,
                               std::shared_ptr<EventBus> bus)
    : m_config(std::move(config)),
      m_router(std::move(router)),
      m_executor(std::move(executor)),
      m_cognition(std::move(cognition)),
      m_bus(std::move(bus)) {
    m_input = m_router->queueFor(name());
}

void DecisionEngine::run(UnitContext& context, CancellationToken& token) {
    if (!context.ai) {
        throw std::runtime_error("[Will] started without a language model");
    }

    while (!token.isCancelled()) {
        auto latest = m_input->popFor(kPollInterval);
        if (!latest) continue;

        // Only the newest impression matters; anything queued behind it is stale.
        while (auto newer = m_input->tryPop()) {
            if (m_cognition.verbose) {
                std::cout << "[Will] Superseded impression " << latest->id << std::endl;
            }
            latest = std::move(newer);
        }
        decide(*latest, context, token);
    }
}

DecisionResult DecisionEngine::decide(const domain::Percept& impression, UnitContext& context,
                                      const CancellationToken& token) {
    DecisionResult result;
    auto registry = m_executor->registry();

    PromptBundle bundle;
    bundle.identity = m_cognition.identity.render();
    bundle.instruction = m_config.prompt;
    bundle.situation = impression.text;
    bundle.manifest = registry->renderManifest();
    if (m_config.recallLimit > 0 && context.memory) {
        bundle.memories = context.memory->recall(impression.text, m_config.recallLimit, {impression.id});
    }

    auto messages = PromptAssembler::BuildDecision(bundle);
    std::string snapshot;
    for (const auto& message : messages) snapshot += message.content;
    std::string hash = domain::ComputeHash(snapshot);

    auto now = std::chrono::steady_clock::now();
    if (hash == m_lastHash && now - m_lastEvaluation < m_config.minInterval) {
        if (m_cognition.verbose) {
            std::cout << "[Will] Unchanged situation, skipping" << std::endl;
        }
        result.throttled = true;
        return result;
    }
    m_lastHash = hash;
    m_lastEvaluation = now;

    std::string freeText;
    domain::Intention current;
    std::shared_ptr<BodyChannel> channel;

    domain::StreamingTagParser::Callbacks callbacks;
    callbacks.onOpen = [&](const std::string& action, const domain::StreamingTagParser::Attributes& attrs) {
        current = domain::Intention{};
        current.id = domain::GenerateId();
        current.action = action;
        current.attributes = attrs;
        current.timestamp = domain::Clock::now();
        current.impressionId = impression.id;

        auto motor = registry->find(action);
        if (motor && motor->schema().streamsBody) {
            // Stored before the call so the MotorCall never points at a missing
            // Intention; the body is still arriving, so the record has none.
            if (context.memory) context.memory->recordIntention(current);
            channel = std::make_shared<BodyChannel>();
            if (auto handle = m_executor->execute(current, channel)) {
                result.calls.push_back(handle);
            }
        }
    };
    callbacks.onBody = [&](const std::string& chunk) {
        if (channel) channel->push(chunk);
    };
    callbacks.onClose = [&](const std::string&, const domain::StreamingTagParser::Attributes&, const std::string& body) {
        current.body = body;
        if (channel) {
            channel->close();
            channel.reset();
        } else {
            if (context.memory) context.memory->recordIntention(current);
            if (auto handle = m_executor->execute(current)) {
                result.calls.push_back(handle);
            }
        }
        result.intentions.push_back(current);
    };
    callbacks.onText = [&](const std::string& text) { freeText += text; };

    domain::StreamingTagParser parser([&registry](const std::string& action) { return registry->contains(action); },
                                      callbacks);

    bool anyToken = false;
    bool completed = false;
    bool ok = m_cognition.retry.run([&](int) {
        bool timedOut = false;
        auto deadline = std::chrono::steady_clock::now() + m_cognition.llmTimeout;
        completed = context.ai->streamChat(messages, [&](const std::string& piece) {
            if (token.isCancelled()) return false;
            if (std::chrono::steady_clock::now() > deadline) {
                timedOut = true;
                return false;
            }
            anyToken = true;
            parser.feed(piece);
            return true;
        });
        if (timedOut) {
            std::cerr << "[Will] Model call exceeded " << m_cognition.llmTimeout.count() << "ms" << std::endl;
        }
        // Actions may already be running; a partial reply is never replayed.
        return completed || anyToken;
    }, token, "[Will]");
    result.invoked = true;

    if (anyToken) {
        parser.finish();
        if (!completed) {
            std::cerr << "[Will] Stream broke after partial output; keeping what was dispatched" << std::endl;
        }
    }
    if (channel) channel->close();

    if (!ok) {
        result.failed = true;
        if (token.isCancelled()) return result;
        ++m_consecutiveFailures;
        std::cerr << "[Will] No response for impression " << impression.id << std::endl;
        if (m_bus && m_consecutiveFailures == m_cognition.healthFailureThreshold) {
            m_bus->publish("health/degraded", name(),
                           std::to_string(m_consecutiveFailures) + " consecutive decisions failed");
        }
        return result;
    }
    m_consecutiveFailures = 0;

    result.thought = domain::Trim(freeText);
    if (!result.thought.empty()) {
        broadcastThought(result.thought, context);
    }

    if (result.intentions.empty()) {
        std::cerr << "[Will] Anomaly: response contained no actions" << std::endl;
    } else {
        std::cout << "[Will] Dispatched " << result.intentions.size() << " intention(s)" << std::endl;
    }
    return result;
}

void DecisionEngine::broadcastThought(const std::string& thought, UnitContext& context) {
    std::cout << "[Will] Thought: " << thought << std::endl;
    if (m_bus) m_bus->publish("thought", name(), thought);

    if (m_config.thoughtPath.empty()) return;

    domain::Sensation sensation;
    sensation.timestamp = domain::Clock::now();
    sensation.kind = "sensation" + m_config.thoughtPath;
    sensation.source = name();
    sensation.text = ThoughtText(thought);

    if (context.memory) {
        auto outcome = context.memory->recordSensation(sensation);
        if (outcome == domain::InsertOutcome::Duplicate) return;
    } else {
        sensation.id = domain::GenerateId();
    }
    m_router->route(domain::Percept::FromSensation(sensation));
}

} // namespace psyche::application
