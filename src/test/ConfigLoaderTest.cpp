#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/Identifiers.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace psyche;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string ErrorOf(const json& j) {
    try {
        infrastructure::ConfigLoader::FromJson(j);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

void TestDefaults() {
    std::cout << "[Test] TestDefaults..." << std::endl;
    auto config = infrastructure::ConfigLoader::Defaults();

    assert(config.distillers.size() == 2);
    assert(config.distillers[0].name == "quick");
    assert(config.distillers[0].inputs == std::vector<std::string>{"sensation"});
    assert(config.distillers[1].name == "combobulator");
    assert(config.distillers[1].level == domain::ImpressionLevel::Situation);
    assert(!config.distillers[0].prompt.empty());
    assert(config.will.prompt.find("{{motors}}") != std::string::npos);
    assert(config.will.level == domain::ImpressionLevel::Situation);
    assert(!config.memoryDir.empty());
    assert(!config.socketPath.empty());

    std::cout << "[PASS] TestDefaults" << std::endl;
}

void TestFromJson() {
    std::cout << "[Test] TestFromJson..." << std::endl;
    json j = {
        {"identity", {{"name", "Layka"}, {"role", "A small robot"}}},
        {"memory_dir", "/tmp/psyche-mem"},
        {"durable_writes", true},
        {"llm", {{"host", "gpu-box"}, {"port", 8080}, {"model", "gemma3"}, {"timeout_ms", 15000}}},
        {"distillers", json::array({
            {{"name", "glance"}, {"inputs", json::array({"sensation/vision"})}, {"level", "instant"}, {"batch_size", 3},
             {"quiescence_ms", 2000}},
            {{"name", "story"}, {"inputs", json::array({"impression/instant"})}, {"level", "episode"},
             {"prompt", "Tell the story of {{items}}"}, {"feedback", "glance"}, {"recall_limit", 5}}
        })},
        {"will", {{"decision_level", "episode"}, {"min_interval_ms", 500}, {"thought_path", "inner"}}},
        {"motors", {{"max_pending", 4}, {"tts_url", "http://tts:5002"}, {"action_timeout_ms", 1000}}},
        {"supervisor", {{"restart_base_ms", 50}, {"pin_cores", true}}},
        {"log", {{"verbose", true}}}
    };

    auto config = infrastructure::ConfigLoader::FromJson(j);
    assert(config.cognition.identity.name == "Layka");
    assert(config.cognition.identity.role == "A small robot");
    assert(config.cognition.identity.render().find("You are Layka.") == 0);
    assert(config.memoryDir == "/tmp/psyche-mem");
    assert(config.durableWrites);
    assert(config.llm.host == "gpu-box");
    assert(config.llm.port == 8080);
    assert(config.llm.model == "gemma3");
    assert(config.cognition.llmTimeout.count() == 15000);

    assert(config.distillers.size() == 2);
    const auto& glance = config.distillers[0];
    assert(glance.batchSize == 3);
    assert(glance.quiescence.count() == 2000);
    assert(!glance.prompt.empty());
    const auto& story = config.distillers[1];
    assert(story.level == domain::ImpressionLevel::Episode);
    assert(story.prompt == "Tell the story of {{items}}");
    assert(story.feedback == "glance");
    assert(story.recallLimit == 5);

    assert(config.will.level == domain::ImpressionLevel::Episode);
    assert(config.will.minInterval.count() == 500);
    assert(config.will.thoughtPath == "/inner");
    assert(config.motors.maxPending == 4);
    assert(config.motors.ttsUrl == "http://tts:5002");
    assert(config.motors.actionTimeout.count() == 1000);
    assert(config.supervisor.restartBase.count() == 50);
    assert(config.supervisor.pinCores);
    assert(config.cognition.verbose);

    std::cout << "[PASS] TestFromJson" << std::endl;
}

void TestInvalidValuesNameTheKey() {
    std::cout << "[Test] TestInvalidValuesNameTheKey..." << std::endl;
    assert(ErrorOf({{"llm", {{"port", "eleven"}}}}).find("'llm.port'") != std::string::npos);
    assert(ErrorOf({{"llm", {{"port", 70000}}}}).find("'llm.port'") != std::string::npos);
    assert(ErrorOf({{"motors", {{"max_pending", 0}}}}).find("'motors.max_pending'") != std::string::npos);
    assert(ErrorOf({{"will", {{"decision_level", "cosmic"}}}}).find("'will.decision_level'") != std::string::npos);
    assert(ErrorOf({{"supervisor", {{"restart_max_ms", -1}}}}).find("'supervisor.restart_max_ms'") != std::string::npos);
    assert(ErrorOf({{"distillers", json::array({{{"inputs", json::array({"sensation"})}}})}}).find("'distillers[0].name'")
           != std::string::npos);
    assert(ErrorOf({{"distillers", json::array({{{"name", "a"}, {"inputs", json::array()}}})}}).find("inputs")
           != std::string::npos);
    assert(ErrorOf({{"distillers", json::array({{{"name", "will"}, {"inputs", json::array({"sensation"})}}})}}).find("reserved")
           != std::string::npos);
    assert(ErrorOf({{"distillers", json::array({{{"name", "a"}, {"inputs", json::array({"sensation"})}},
                                                 {{"name", "a"}, {"inputs", json::array({"sensation"})}}})}}).find("duplicate")
           != std::string::npos);
    assert(ErrorOf({{"distillers", json::array({{{"name", "a"}, {"inputs", json::array({"sensation"})}, {"feedback", "ghost"}}})}})
               .find("ghost") != std::string::npos);
    assert(ErrorOf(json::array()).find("<root>") != std::string::npos);
    assert(ErrorOf(json::object()).empty());

    std::cout << "[PASS] TestInvalidValuesNameTheKey" << std::endl;
}

void TestLoadFromFile() {
    std::cout << "[Test] TestLoadFromFile..." << std::endl;
    fs::path dir = fs::temp_directory_path() / ("psyche_config_" + domain::GenerateId());
    fs::create_directories(dir);

    auto missing = infrastructure::ConfigLoader::Load((dir / "absent.json").string());
    assert(missing.distillers.size() == 2);

    fs::path good = dir / "config.json";
    {
        std::ofstream out(good);
        out << R"({"socket_path": "/tmp/psyche-test.sock", "will": {"thought_path": ""}})";
    }
    auto loaded = infrastructure::ConfigLoader::Load(good.string());
    assert(loaded.socketPath == "/tmp/psyche-test.sock");
    assert(loaded.will.thoughtPath.empty());

    fs::path bad = dir / "broken.json";
    {
        std::ofstream out(bad);
        out << "{ \"llm\": { \"port\": ";
    }
    bool threw = false;
    try {
        infrastructure::ConfigLoader::Load(bad.string());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("broken.json") != std::string::npos;
    }
    assert(threw);

    fs::remove_all(dir);
    std::cout << "[PASS] TestLoadFromFile" << std::endl;
}

int main() {
    TestDefaults();
    TestFromJson();
    TestInvalidValuesNameTheKey();
    TestLoadFromFile();
    std::cout << "All config tests passed." << std::endl;
    return 0;
}
