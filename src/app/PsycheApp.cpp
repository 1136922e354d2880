/**
 * @file PsycheApp.cpp
 * @brief Implementation of the PsycheApp class.
 */
#include "app/PsycheApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <thread>
#include "infrastructure/MemoryStoreFs.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/motors/LogMotor.hpp"
#include "infrastructure/motors/RecallMotor.hpp"
#include "infrastructure/motors/SpeakMotor.hpp"

namespace psyche::app {

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested = true;
}

std::string FormatTime(domain::Timestamp ts) {
    std::time_t t = domain::Clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

} // namespace

PsycheApp::PsycheApp(application::RuntimeConfig config)
    : m_config(std::move(config)) {}

PsycheApp::~PsycheApp() {
    Shutdown();
}

bool PsycheApp::Init() {
    if (m_initialized) return true;

    m_services.bus = std::make_shared<application::EventBus>();
    m_services.router = std::make_shared<application::Router>();
    m_services.persistence = std::make_shared<infrastructure::PersistenceService>();

    m_store = std::make_shared<infrastructure::MemoryStoreFs>(m_config.memoryDir, m_services.persistence,
                                                              m_config.durableWrites);
    size_t loaded = m_store->load();
    std::cout << "[PsycheApp] Memory at " << m_config.memoryDir << " (" << loaded << " records)" << std::endl;

    auto bus = m_services.bus;
    m_store->setFailureHandler([bus](const std::string& file) {
        bus->publish("health/degraded", "memory", "write failed: " + file);
    });

    if (!m_config.llm.embeddingModel.empty() || !m_config.llm.model.empty()) {
        auto embedder = std::make_shared<infrastructure::OllamaAdapter>(
            m_config.llm.host, m_config.llm.port, m_config.llm.model, m_config.llm.embeddingModel,
            m_config.cognition.llmTimeout);
        m_store->setEmbedder([embedder](const std::string& text) { return embedder->getEmbedding(text); });
    }
    m_services.memoryStore = m_store;

    for (const auto& distiller : m_config.distillers) {
        for (const auto& input : distiller.inputs) {
            m_services.router->addRoute(input, distiller.name);
        }
    }
    m_services.router->addRoute("impression/" + domain::LevelToString(m_config.will.level), "will");

    registerMotors();
    m_services.motorExecutor = std::make_shared<application::MotorExecutor>(
        m_services.motorRegistry, m_config.motors, m_services.bus);

    for (const auto& distillerConfig : m_config.distillers) {
        m_services.distillers.push_back(std::make_shared<application::Distiller>(
            distillerConfig, m_services.router, m_config.cognition, m_services.bus));
    }
    m_services.will = std::make_shared<application::DecisionEngine>(
        m_config.will, m_services.router, m_services.motorExecutor, m_config.cognition, m_services.bus);
    m_services.ingestor = std::make_shared<application::SensationIngestor>(
        m_config.socketPath, m_services.router, m_services.bus, m_config.cognition.verbose);

    auto lifecycleMemory = std::make_shared<application::MemoryService>(m_store, m_config.dedupResolution, m_services.bus);
    m_services.supervisor = std::make_unique<application::Supervisor>(
        m_config.supervisor, makeContextFactory(), lifecycleMemory, m_services.bus);

    m_services.supervisor->registerUnit(m_services.ingestor);
    for (const auto& distiller : m_services.distillers) {
        m_services.supervisor->registerUnit(distiller);
    }
    m_services.supervisor->registerUnit(m_services.will);
    m_services.supervisor->registerUnit(m_services.motorExecutor);

    printEvents();
    m_services.supervisor->start();
    m_initialized = true;

    std::cout << "[PsycheApp] " << m_config.cognition.identity.name << " is awake. Actions:\n"
              << m_services.motorRegistry->renderManifest() << std::flush;
    return true;
}

application::UnitContextFactory PsycheApp::makeContextFactory() {
    auto store = m_store;
    auto bus = m_services.bus;
    auto llm = m_config.llm;
    auto timeout = m_config.cognition.llmTimeout;
    auto dedup = m_config.dedupResolution;

    return [store, bus, llm, timeout, dedup](const std::string&) {
        application::UnitContext context;
        auto ai = std::make_shared<infrastructure::OllamaAdapter>(llm.host, llm.port, llm.model,
                                                                  llm.embeddingModel, timeout);
        ai->initialize();
        context.ai = ai;
        context.memory = std::make_shared<application::MemoryService>(store, dedup, bus);
        return context;
    };
}

void PsycheApp::registerMotors() {
    m_services.motorRegistry = std::make_shared<application::MotorRegistry>();
    m_services.motorRegistry->registerMotor(std::make_shared<infrastructure::LogMotor>());
    m_services.motorRegistry->registerMotor(std::make_shared<infrastructure::SpeakMotor>(
        m_config.motors.ttsUrl, m_config.motors.speakerId, m_config.motors.actionTimeout));

    auto motorMemory = std::make_shared<application::MemoryService>(m_store, m_config.dedupResolution, m_services.bus);
    m_services.motorRegistry->registerMotor(std::make_shared<infrastructure::RecallMotor>(
        motorMemory, m_services.router, m_config.will.recallLimit > 0 ? m_config.will.recallLimit : 3));
}

void PsycheApp::printEvents() {
    bool verbose = m_config.cognition.verbose;
    m_printerSubscription = m_services.bus->subscribe([verbose](const application::RuntimeEvent& event) {
        if (!verbose && event.topic.rfind("motor/call", 0) == 0) return;
        std::cout << "[" << FormatTime(event.timestamp) << "] " << event.topic
                  << " (" << event.source << ") " << event.message << std::endl;
    });
}

int PsycheApp::Run() {
    try {
        if (!Init()) return 1;
    } catch (const std::exception& e) {
        std::cerr << "[PsycheApp] Startup failed: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    while (!g_stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[PsycheApp] Stop requested" << std::endl;
    Shutdown();
    return 0;
}

void PsycheApp::Shutdown() {
    if (!m_initialized) return;
    m_initialized = false;

    if (m_services.supervisor) m_services.supervisor->shutdown();
    m_services.router->closeAll();
    if (m_store) m_store->flush();
    if (m_services.persistence) m_services.persistence->stop();
    if (m_printerSubscription != 0) {
        m_services.bus->unsubscribe(m_printerSubscription);
        m_printerSubscription = 0;
    }
    std::cout << "[PsycheApp] Shutdown complete" << std::endl;
}

} // namespace psyche::app
