#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "application/DecisionEngine.hpp"
#include "application/EventBus.hpp"
#include "application/MemoryService.hpp"
#include "application/MotorExecutor.hpp"
#include "application/MotorRegistry.hpp"
#include "application/Router.hpp"
#include "domain/Identifiers.hpp"
#include "infrastructure/MemoryStoreFs.hpp"
#include "infrastructure/motors/LogMotor.hpp"
#include "ScriptedAIService.hpp"

using namespace psyche;
using namespace std::chrono_literals;

namespace {

using SteadyClock = std::chrono::steady_clock;

// Streaming voice double: remembers when each chunk arrived.
class VoiceMotor : public domain::Motor {
public:
    explicit VoiceMotor(std::shared_ptr<infrastructure::MemoryStoreFs> store) : m_store(std::move(store)) {}

    domain::MotorSchema schema() const override {
        domain::MotorSchema s;
        s.name = "speak";
        s.description = "Say the body out loud";
        s.streamsBody = true;
        s.exclusive = true;
        return s;
    }

    std::string perform(domain::MotorInvocation& invocation) override {
        if (m_store->get(invocation.intention.id)) ++m_intentionStored;
        std::string said;
        while (auto chunk = invocation.nextChunk()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_firstChunk == SteadyClock::time_point{}) m_firstChunk = SteadyClock::now();
            said += *chunk;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_said.push_back(said);
        return "said " + std::to_string(said.size()) + " chars";
    }

    SteadyClock::time_point firstChunk() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_firstChunk;
    }

    std::vector<std::string> said() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_said;
    }

    int intentionStored() const { return m_intentionStored.load(); }

private:
    std::shared_ptr<infrastructure::MemoryStoreFs> m_store;
    std::atomic<int> m_intentionStored{0};
    mutable std::mutex m_mutex;
    SteadyClock::time_point m_firstChunk{};
    std::vector<std::string> m_said;
};

struct Fixture {
    std::shared_ptr<infrastructure::MemoryStoreFs> store = std::make_shared<infrastructure::MemoryStoreFs>("", nullptr);
    std::shared_ptr<application::EventBus> bus = std::make_shared<application::EventBus>();
    std::shared_ptr<application::MemoryService> memory = std::make_shared<application::MemoryService>(
        store, std::chrono::milliseconds(1000), bus);
    std::shared_ptr<application::Router> router = std::make_shared<application::Router>();
    std::shared_ptr<application::MotorRegistry> registry = std::make_shared<application::MotorRegistry>();
    std::shared_ptr<application::MotorExecutor> executor;
    std::shared_ptr<ScriptedAIService> ai = std::make_shared<ScriptedAIService>();
    std::shared_ptr<VoiceMotor> voice = std::make_shared<VoiceMotor>(store);

    application::UnitContext motorContext;
    application::CancellationToken motorToken;
    std::thread motorThread;

    application::UnitContext context;
    application::CancellationToken token;
    application::CognitionSettings cognition;
    application::DecisionConfig config;

    Fixture() {
        registry->registerMotor(voice);
        registry->registerMotor(std::make_shared<infrastructure::LogMotor>());
        executor = std::make_shared<application::MotorExecutor>(registry, application::MotorSettings{}, bus);
        motorContext.memory = memory;
        motorThread = std::thread([this] { executor->run(motorContext, motorToken); });

        context.ai = ai;
        context.memory = memory;
        cognition.retry.maxRetries = 2;
        cognition.retry.baseDelay = 1ms;
        cognition.retry.maxDelay = 2ms;
        cognition.healthFailureThreshold = 2;
        config.prompt = "Choose your actions.";
        config.minInterval = 10s;
        config.recallLimit = 0;
        config.thoughtPath = "/thought";
    }

    ~Fixture() {
        motorToken.cancel();
        motorThread.join();
    }

    std::shared_ptr<application::DecisionEngine> makeWill() {
        return std::make_shared<application::DecisionEngine>(config, router, executor, cognition, bus);
    }

    domain::Percept situation(const std::string& text) {
        domain::Sensation seed{"", domain::Clock::now(), "sensation/chat", "test", text};
        memory->recordSensation(seed);
        domain::Impression imp{domain::GenerateId(), domain::Clock::now(), domain::ImpressionLevel::Situation,
                               text, {seed.id}, "combobulator"};
        memory->recordImpression(imp);
        return domain::Percept::FromImpression(imp);
    }
};

} // namespace

void TestSpeechStreamsBeforeReplyEnds() {
    std::cout << "[Test] TestSpeechStreamsBeforeReplyEnds..." << std::endl;
    Fixture f;
    auto will = f.makeWill();

    ScriptedAIService::Reply reply;
    reply.tokens = {"<speak>", "Hello ", "there, ", "how ", "are ", "you ", "doing ", "today?", "</speak>"};
    reply.tokenDelay = 40ms;
    f.ai->enqueue(reply);

    auto result = will->decide(f.situation("Someone just walked in."), f.context, f.token);
    auto finished = SteadyClock::now();

    assert(result.invoked && !result.failed);
    assert(result.intentions.size() == 1);
    assert(result.intentions[0].action == "speak");
    assert(result.intentions[0].body == "Hello there, how are you doing today?");
    assert(result.calls.size() == 1);

    auto outcome = result.calls[0]->wait(2s);
    assert(outcome && outcome->completed());
    assert(f.voice->said() == std::vector<std::string>{"Hello there, how are you doing today?"});
    // The first words reached the motor while the model was still talking.
    assert(f.voice->firstChunk() + 150ms < finished);

    // The Intention was already stored when its call started.
    assert(f.voice->intentionStored() == 1);
    auto executes = f.store->linksFrom(outcome->call.id, domain::relations::Executes);
    assert(executes.size() == 1 && executes[0].to == result.intentions[0].id);
    auto stored = f.store->get(result.intentions[0].id);
    assert(stored && stored->kind == domain::kinds::Intention);
    assert(f.store->linksFrom(stored->id, domain::relations::MotivatedBy).size() == 1);

    std::cout << "[PASS] TestSpeechStreamsBeforeReplyEnds" << std::endl;
}

void TestThrottleOnUnchangedSituation() {
    std::cout << "[Test] TestThrottleOnUnchangedSituation..." << std::endl;
    Fixture f;
    auto will = f.makeWill();
    f.ai->setResponder([](const std::vector<domain::AIService::ChatMessage>&) {
        return ScriptedAIService::Text("<log>noted</log>");
    });

    auto percept = f.situation("The room is quiet.");
    auto first = will->decide(percept, f.context, f.token);
    assert(first.invoked && !first.throttled);

    auto second = will->decide(percept, f.context, f.token);
    assert(second.throttled && !second.invoked);
    assert(f.ai->calls() == 1);

    auto third = will->decide(f.situation("A phone starts ringing."), f.context, f.token);
    assert(third.invoked);
    assert(f.ai->calls() == 2);

    for (const auto& result : {first, third}) {
        auto outcome = result.calls.at(0)->wait(2s);
        assert(outcome && outcome->completed());
    }

    std::cout << "[PASS] TestThrottleOnUnchangedSituation" << std::endl;
}

void TestThoughtIsRouted() {
    std::cout << "[Test] TestThoughtIsRouted..." << std::endl;
    Fixture f;
    f.router->addRoute("sensation", "quick");
    auto quick = f.router->queueFor("quick");
    std::vector<std::string> thoughts;
    f.bus->subscribe([&](const application::RuntimeEvent& e) { thoughts.push_back(e.message); }, "thought");

    auto will = f.makeWill();
    f.ai->enqueue(ScriptedAIService::Text("I should greet them. <log level=\"info\">greeting</log> Then wait."));

    auto percept = f.situation("A visitor is at the door.");
    auto result = will->decide(percept, f.context, f.token);
    assert(result.thought == "I should greet them.  Then wait.");
    assert(thoughts == std::vector<std::string>{result.thought});

    auto routed = quick->tryPop();
    assert(routed);
    assert(routed->kind == "sensation/thought");
    assert(routed->source == "will");
    assert(routed->text == application::DecisionEngine::ThoughtText(result.thought));

    const auto& intention = result.intentions.at(0);
    assert(intention.attributes.at("level") == "info");
    auto motivated = f.store->linksFrom(intention.id, domain::relations::MotivatedBy);
    assert(motivated.size() == 1 && motivated[0].to == percept.id);

    auto outcome = result.calls.at(0)->wait(2s);
    assert(outcome && outcome->completed());
    assert(f.memory->resolutionsOf(outcome->call.id).size() == 1);

    std::cout << "[PASS] TestThoughtIsRouted" << std::endl;
}

void TestPartialReplyIsNotReplayed() {
    std::cout << "[Test] TestPartialReplyIsNotReplayed..." << std::endl;
    Fixture f;
    auto will = f.makeWill();

    ScriptedAIService::Reply broken;
    broken.tokens = {"<log>first</log>", " and <lo"};
    broken.ok = false;
    f.ai->enqueue(broken);
    f.ai->enqueue(ScriptedAIService::Text("<log>second</log>"));

    auto result = will->decide(f.situation("The connection is flaky."), f.context, f.token);
    assert(f.ai->calls() == 1);
    assert(!result.failed);
    assert(result.intentions.size() == 1);
    assert(result.intentions[0].body == "first");
    assert(result.thought == "and <lo");

    std::cout << "[PASS] TestPartialReplyIsNotReplayed" << std::endl;
}

void TestAnomalyAndFailure() {
    std::cout << "[Test] TestAnomalyAndFailure..." << std::endl;
    Fixture f;
    f.config.thoughtPath.clear();
    auto will = f.makeWill();
    int degraded = 0;
    f.bus->subscribe([&](const application::RuntimeEvent&) { ++degraded; }, "health/degraded");

    f.ai->enqueue(ScriptedAIService::Text("I have nothing to do. <dance>wildly</dance>"));
    auto anomaly = will->decide(f.situation("Nothing happens."), f.context, f.token);
    assert(anomaly.invoked && !anomaly.failed);
    assert(anomaly.intentions.empty());
    assert(anomaly.thought == "I have nothing to do. wildly");

    auto failed = will->decide(f.situation("Still nothing."), f.context, f.token);
    assert(failed.failed);
    assert(f.ai->calls() == 1 + 3);
    assert(degraded == 0);

    auto again = will->decide(f.situation("Nothing at all."), f.context, f.token);
    assert(again.failed);
    assert(degraded == 1);

    std::cout << "[PASS] TestAnomalyAndFailure" << std::endl;
}

void TestRunKeepsNewestImpression() {
    std::cout << "[Test] TestRunKeepsNewestImpression..." << std::endl;
    Fixture f;
    f.config.thoughtPath.clear();
    f.router->addRoute("impression/situation", "will");
    auto will = f.makeWill();
    f.ai->setResponder([](const std::vector<domain::AIService::ChatMessage>&) {
        return ScriptedAIService::Text("<log>ok</log>");
    });

    f.router->route(f.situation("It is morning."));
    f.router->route(f.situation("It is noon."));
    f.router->route(f.situation("It is evening."));

    std::thread runner([&] { will->run(f.context, f.token); });
    for (int i = 0; i < 100 && f.ai->calls() == 0; ++i) std::this_thread::sleep_for(10ms);
    std::this_thread::sleep_for(150ms);
    f.token.cancel();
    will->onShutdown();
    runner.join();

    assert(f.ai->calls() == 1);
    std::string prompt = f.ai->prompts().at(0).at(0).content;
    assert(prompt.find("It is evening.") != std::string::npos);
    assert(prompt.find("It is morning.") == std::string::npos);
    assert(prompt.find("=== ACTIONS ===\n") != std::string::npos);
    assert(prompt.find("<log> body </log>") != std::string::npos);

    std::cout << "[PASS] TestRunKeepsNewestImpression" << std::endl;
}

int main() {
    TestSpeechStreamsBeforeReplyEnds();
    TestThrottleOnUnchangedSituation();
    TestThoughtIsRouted();
    TestPartialReplyIsNotReplayed();
    TestAnomalyAndFailure();
    TestRunKeepsNewestImpression();
    std::cout << "All decision tests passed." << std::endl;
    return 0;
}
