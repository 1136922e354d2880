#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "application/EventBus.hpp"
#include "application/MemoryService.hpp"
#include "application/MotorExecutor.hpp"
#include "application/MotorRegistry.hpp"
#include "application/Router.hpp"
#include "domain/Identifiers.hpp"
#include "infrastructure/MemoryStoreFs.hpp"
#include "infrastructure/motors/LogMotor.hpp"
#include "infrastructure/motors/RecallMotor.hpp"
#include "infrastructure/motors/SpeakMotor.hpp"

using namespace psyche;
using namespace std::chrono_literals;

namespace {

class EchoMotor : public domain::Motor {
public:
    domain::MotorSchema schema() const override {
        domain::MotorSchema s;
        s.name = "Echo";
        s.description = "Repeat the body";
        return s;
    }
    std::string perform(domain::MotorInvocation& invocation) override {
        return "echo:" + invocation.readBody();
    }
};

class PointMotor : public domain::Motor {
public:
    domain::MotorSchema schema() const override {
        domain::MotorSchema s;
        s.name = "point";
        s.description = "Point at something";
        s.required = {"target"};
        s.optional = {"hand"};
        return s;
    }
    std::string perform(domain::MotorInvocation& invocation) override {
        return "pointed at " + invocation.intention.attributes.at("target");
    }
};

class BrokenMotor : public domain::Motor {
public:
    domain::MotorSchema schema() const override {
        domain::MotorSchema s;
        s.name = "broken";
        s.description = "Always fails";
        return s;
    }
    std::string perform(domain::MotorInvocation&) override {
        throw std::runtime_error("actuator jammed");
    }
};

// Runs until cancelled, recording every body chunk it receives.
class HoldMotor : public domain::Motor {
public:
    explicit HoldMotor(bool exclusive) : m_exclusive(exclusive) {}

    domain::MotorSchema schema() const override {
        domain::MotorSchema s;
        s.name = "hold";
        s.description = "Hold a pose";
        s.streamsBody = true;
        s.exclusive = m_exclusive;
        return s;
    }
    std::string perform(domain::MotorInvocation& invocation) override {
        while (auto chunk = invocation.nextChunk()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_chunks.push_back(*chunk);
        }
        ++m_started;
        while (!invocation.cancelled() && !m_released) {
            std::this_thread::sleep_for(5ms);
        }
        return "released";
    }
    void release() { m_released = true; }
    std::vector<std::string> chunks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_chunks;
    }
    int started() const { return m_started.load(); }

private:
    bool m_exclusive;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_chunks;
    std::atomic<int> m_started{0};
    std::atomic<bool> m_released{false};
};

domain::Intention MakeIntention(const std::string& action, const std::string& body = "",
                                std::map<std::string, std::string> attributes = {}) {
    return domain::Intention{domain::GenerateId(), action, std::move(attributes), body, domain::Clock::now(), ""};
}

struct Fixture {
    std::shared_ptr<infrastructure::MemoryStoreFs> store = std::make_shared<infrastructure::MemoryStoreFs>("", nullptr);
    std::shared_ptr<application::MemoryService> memory = std::make_shared<application::MemoryService>(store);
    std::shared_ptr<application::EventBus> bus = std::make_shared<application::EventBus>();
    std::shared_ptr<application::MotorRegistry> registry = std::make_shared<application::MotorRegistry>();
    std::shared_ptr<application::MotorExecutor> executor;
    application::UnitContext context;
    application::CancellationToken token;
    std::thread runner;

    explicit Fixture(application::MotorSettings settings = {}) {
        executor = std::make_shared<application::MotorExecutor>(registry, settings, bus);
        context.memory = memory;
    }

    void start() {
        runner = std::thread([this] { executor->run(context, token); });
    }

    void stop() {
        token.cancel();
        if (runner.joinable()) runner.join();
    }

    ~Fixture() { stop(); }
};

void AssertResolvedOnce(const application::MemoryService& memory, const std::string& callId) {
    assert(memory.resolutionsOf(callId).size() == 1);
}

} // namespace

void TestManifest() {
    std::cout << "[Test] TestManifest..." << std::endl;
    application::MotorRegistry registry;
    registry.registerMotor(std::make_shared<PointMotor>());
    registry.registerMotor(std::make_shared<infrastructure::SpeakMotor>());
    registry.registerMotor(std::make_shared<EchoMotor>());

    assert(registry.contains("ECHO"));
    assert(registry.names() == (std::vector<std::string>{"echo", "point", "speak"}));

    std::string manifest = registry.renderManifest();
    assert(manifest.find("<point target=\"...\"> body </point>: Point at something (required: target; optional: hand)\n")
           != std::string::npos);
    assert(manifest.find("<speak> body </speak>: Say the body out loud to whoever is listening (optional: speaker_id; streams body)")
           != std::string::npos);
    assert(manifest.find("<echo> body </echo>: Repeat the body\n") != std::string::npos);

    bool threw = false;
    try {
        registry.registerMotor(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] TestManifest" << std::endl;
}

void TestCompletionIsRecorded() {
    std::cout << "[Test] TestCompletionIsRecorded..." << std::endl;
    Fixture f;
    f.registry->registerMotor(std::make_shared<EchoMotor>());
    f.start();

    auto intention = MakeIntention("echo", "hello");
    f.memory->recordIntention(intention);
    auto handle = f.executor->execute(intention);
    assert(handle);

    auto outcome = handle->wait(2s);
    assert(outcome);
    assert(outcome->completed());
    assert(outcome->completion->result == "echo:hello");
    assert(outcome->call.intentionId == intention.id);

    auto call = f.store->get(outcome->call.id);
    assert(call);
    assert(call->kind == domain::kinds::MotorCall);
    assert(f.store->linksFrom(outcome->call.id, domain::relations::Executes).size() == 1);
    AssertResolvedOnce(*f.memory, outcome->call.id);

    std::cout << "[PASS] TestCompletionIsRecorded" << std::endl;
}

void TestDispatchErrors() {
    std::cout << "[Test] TestDispatchErrors..." << std::endl;
    Fixture f;
    f.registry->registerMotor(std::make_shared<PointMotor>());
    f.registry->registerMotor(std::make_shared<BrokenMotor>());

    std::vector<std::string> interruptions;
    std::mutex eventsMutex;
    f.bus->subscribe([&](const application::RuntimeEvent& e) {
        std::lock_guard<std::mutex> lock(eventsMutex);
        interruptions.push_back(e.message);
    }, "motor/interruption");
    f.start();

    auto unknown = f.executor->execute(MakeIntention("fly"));
    auto missing = f.executor->execute(MakeIntention("point", "", {{"hand", "left"}}));
    auto thrown = f.executor->execute(MakeIntention("broken"));
    auto fine = f.executor->execute(MakeIntention("point", "", {{"target", "door"}}));

    auto o1 = unknown->wait(2s);
    assert(o1 && o1->interruption);
    assert(o1->interruption->cause == domain::InterruptionCause::Error);
    assert(o1->interruption->detail == "unknown action: fly");

    auto o2 = missing->wait(2s);
    assert(o2 && o2->interruption);
    assert(o2->interruption->detail == "missing required attribute: target");

    auto o3 = thrown->wait(2s);
    assert(o3 && o3->interruption);
    assert(o3->interruption->detail == "actuator jammed");

    auto o4 = fine->wait(2s);
    assert(o4 && o4->completed());
    assert(o4->completion->result == "pointed at door");

    for (const auto& handle : {unknown, missing, thrown, fine}) {
        AssertResolvedOnce(*f.memory, handle->call().id);
    }
    f.stop();
    std::lock_guard<std::mutex> lock(eventsMutex);
    assert(interruptions.size() == 3);

    std::cout << "[PASS] TestDispatchErrors" << std::endl;
}

void TestExclusiveSupersedes() {
    std::cout << "[Test] TestExclusiveSupersedes..." << std::endl;
    Fixture f;
    auto motor = std::make_shared<HoldMotor>(true);
    f.registry->registerMotor(motor);
    f.start();

    auto first = f.executor->execute(MakeIntention("hold", "left"));
    while (motor->started() < 1) std::this_thread::sleep_for(5ms);
    auto second = f.executor->execute(MakeIntention("hold", "right"));

    auto o1 = first->wait(2s);
    assert(o1 && o1->interruption);
    assert(o1->interruption->cause == domain::InterruptionCause::Superseded);
    assert(!second->resolved());
    assert(f.executor->inFlight() == 1);

    // The superseding call runs to its normal end.
    motor->release();
    auto o2 = second->wait(2s);
    assert(o2 && o2->completed());
    assert(o2->completion->result == "released");
    f.stop();

    // The superseded call ended in its own thread; it must not resolve a second time.
    std::this_thread::sleep_for(50ms);
    AssertResolvedOnce(*f.memory, first->call().id);
    AssertResolvedOnce(*f.memory, second->call().id);

    std::cout << "[PASS] TestExclusiveSupersedes" << std::endl;
}

void TestNonExclusiveRunConcurrently() {
    std::cout << "[Test] TestNonExclusiveRunConcurrently..." << std::endl;
    Fixture f;
    auto motor = std::make_shared<HoldMotor>(false);
    f.registry->registerMotor(motor);
    f.start();

    auto a = f.executor->execute(MakeIntention("hold", "a"));
    auto b = f.executor->execute(MakeIntention("hold", "b"));
    while (motor->started() < 2) std::this_thread::sleep_for(5ms);
    assert(!a->resolved() && !b->resolved());
    assert(f.executor->inFlight() == 2);

    f.stop();
    assert(a->wait(2s)->interruption->cause == domain::InterruptionCause::Cancelled);
    assert(b->wait(2s)->interruption->cause == domain::InterruptionCause::Cancelled);

    std::cout << "[PASS] TestNonExclusiveRunConcurrently" << std::endl;
}

void TestTimeout() {
    std::cout << "[Test] TestTimeout..." << std::endl;
    application::MotorSettings settings;
    settings.actionTimeout = 150ms;
    Fixture f(settings);
    f.registry->registerMotor(std::make_shared<HoldMotor>(false));
    f.start();

    auto handle = f.executor->execute(MakeIntention("hold", "forever"));
    auto outcome = handle->wait(3s);
    assert(outcome && outcome->interruption);
    assert(outcome->interruption->cause == domain::InterruptionCause::Error);
    assert(outcome->interruption->detail.find("timed out") != std::string::npos);
    assert(f.executor->inFlight() == 0);

    std::cout << "[PASS] TestTimeout" << std::endl;
}

void TestStreamingBody() {
    std::cout << "[Test] TestStreamingBody..." << std::endl;
    Fixture f;
    auto motor = std::make_shared<HoldMotor>(false);
    f.registry->registerMotor(motor);
    f.start();

    auto channel = std::make_shared<application::BodyChannel>();
    auto handle = f.executor->execute(MakeIntention("hold"), channel);
    assert(handle);

    channel->push("first ");
    for (int i = 0; i < 200 && motor->chunks().empty(); ++i) std::this_thread::sleep_for(5ms);
    // The motor sees the first chunk while the body is still open.
    assert(motor->chunks() == std::vector<std::string>{"first "});

    channel->push("second");
    channel->close();
    while (motor->started() < 1) std::this_thread::sleep_for(5ms);
    assert(motor->chunks() == (std::vector<std::string>{"first ", "second"}));

    std::cout << "[PASS] TestStreamingBody" << std::endl;
}

void TestQueueFullDropsAndShutdownCancels() {
    std::cout << "[Test] TestQueueFullDropsAndShutdownCancels..." << std::endl;
    application::MotorSettings settings;
    settings.maxPending = 2;
    Fixture f(settings);
    f.registry->registerMotor(std::make_shared<EchoMotor>());

    int dropped = 0;
    f.bus->subscribe([&](const application::RuntimeEvent&) { ++dropped; }, "motor/dropped");

    auto a = f.executor->execute(MakeIntention("echo", "a"));
    auto b = f.executor->execute(MakeIntention("echo", "b"));
    auto c = f.executor->execute(MakeIntention("echo", "c"));
    assert(a && b);
    assert(!c);
    assert(dropped == 1);
    assert(f.executor->pending() == 2);

    // Never dispatched: shutdown resolves both as cancelled.
    f.token.cancel();
    f.executor->run(f.context, f.token);

    for (const auto& handle : {a, b}) {
        auto outcome = handle->outcome();
        assert(outcome && outcome->interruption);
        assert(outcome->interruption->cause == domain::InterruptionCause::Cancelled);
        AssertResolvedOnce(*f.memory, handle->call().id);
    }
    assert(!f.executor->execute(MakeIntention("echo", "late")));

    std::cout << "[PASS] TestQueueFullDropsAndShutdownCancels" << std::endl;
}

void TestSentenceSplitting() {
    std::cout << "[Test] TestSentenceSplitting..." << std::endl;
    std::string pending = "Hello there. Pi is 3.5 roughly! Wait... what";
    auto s1 = infrastructure::SpeakMotor::TakeSentence(pending);
    assert(s1 && *s1 == "Hello there.");
    auto s2 = infrastructure::SpeakMotor::TakeSentence(pending);
    assert(s2 && *s2 == "Pi is 3.5 roughly!");
    auto s3 = infrastructure::SpeakMotor::TakeSentence(pending);
    assert(s3 && *s3 == "Wait...");
    assert(!infrastructure::SpeakMotor::TakeSentence(pending));
    assert(pending == " what");

    std::string trailing = "Done.";
    assert(!infrastructure::SpeakMotor::TakeSentence(trailing));

    std::cout << "[PASS] TestSentenceSplitting" << std::endl;
}

void TestBuiltinMotors() {
    std::cout << "[Test] TestBuiltinMotors..." << std::endl;
    Fixture f;
    auto router = std::make_shared<application::Router>();
    router->addRoute("sensation", "quick");
    auto quick = router->queueFor("quick");

    domain::Sensation seed{"", domain::Clock::now(), "sensation/chat", "socket", "seed"};
    f.memory->recordSensation(seed);
    domain::Impression imp{domain::GenerateId(), domain::Clock::now(), domain::ImpressionLevel::Instant,
                           "I left the umbrella by the door.", {seed.id}, "quick"};
    f.memory->recordImpression(imp);

    f.registry->registerMotor(std::make_shared<infrastructure::LogMotor>());
    f.registry->registerMotor(std::make_shared<infrastructure::SpeakMotor>());
    f.registry->registerMotor(std::make_shared<infrastructure::RecallMotor>(f.memory, router, 3));
    f.start();

    auto log = f.executor->execute(MakeIntention("log", "note to self", {{"level", "info"}}));
    assert(log->wait(2s)->completion->result == "logged 12 chars");

    auto speak = f.executor->execute(MakeIntention("speak", "One. Two!"));
    assert(speak->wait(2s)->completion->result == "spoke 2 sentence(s)");

    auto recall = f.executor->execute(MakeIntention("recall", "where is the umbrella"));
    assert(recall->wait(2s)->completion->result == "recalled 1 memories");
    auto percept = quick->tryPop();
    assert(percept);
    assert(percept->kind == "sensation/recall");
    assert(percept->text == "I remember:\n- I left the umbrella by the door.");

    auto empty = f.executor->execute(MakeIntention("recall", "   "));
    assert(empty->wait(2s)->interruption);

    std::cout << "[PASS] TestBuiltinMotors" << std::endl;
}

int main() {
    TestManifest();
    TestCompletionIsRecorded();
    TestDispatchErrors();
    TestExclusiveSupersedes();
    TestNonExclusiveRunConcurrently();
    TestTimeout();
    TestStreamingBody();
    TestQueueFullDropsAndShutdownCancels();
    TestSentenceSplitting();
    TestBuiltinMotors();
    std::cout << "All motor tests passed." << std::endl;
    return 0;
}
