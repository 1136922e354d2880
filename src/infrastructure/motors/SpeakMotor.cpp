#include "infrastructure/motors/SpeakMotor.hpp"
#include "domain/Identifiers.hpp"
#include <httplib.h>
#include <iostream>
#include <stdexcept>

namespace psyche::infrastructure {

SpeakMotor::SpeakMotor(std::string ttsUrl, std::string speakerId, std::chrono::milliseconds timeout)
    : m_ttsUrl(std::move(ttsUrl)), m_speakerId(std::move(speakerId)), m_timeout(timeout) {}

domain::MotorSchema SpeakMotor::schema() const {
    domain::MotorSchema s;
    s.name = "speak";
    s.description = "Say the body out loud to whoever is listening";
    s.optional = {"speaker_id"};
    s.streamsBody = true;
    s.exclusive = true;
    return s;
}

std::optional<std::string> SpeakMotor::TakeSentence(std::string& pending) {
    for (size_t i = 0; i < pending.size(); ++i) {
        char c = pending[i];
        if (c != '.' && c != '!' && c != '?') continue;
        // "3.5" or "..." mid-stream: wait for the character after the mark.
        if (i + 1 >= pending.size()) return std::nullopt;
        char next = pending[i + 1];
        if (next != ' ' && next != '\n' && next != '\t') continue;

        std::string sentence = domain::Trim(pending.substr(0, i + 1));
        pending.erase(0, i + 1);
        if (sentence.empty()) return TakeSentence(pending);
        return sentence;
    }
    return std::nullopt;
}

std::string SpeakMotor::perform(domain::MotorInvocation& invocation) {
    std::string speakerId = m_speakerId;
    auto attr = invocation.intention.attributes.find("speaker_id");
    if (attr != invocation.intention.attributes.end() && !attr->second.empty()) {
        speakerId = attr->second;
    }

    std::string pending;
    int spoken = 0;
    while (auto chunk = invocation.nextChunk()) {
        pending += *chunk;
        while (auto sentence = SpeakMotor::TakeSentence(pending)) {
            if (invocation.cancelled()) return "interrupted after " + std::to_string(spoken) + " sentence(s)";
            say(*sentence, speakerId);
            ++spoken;
        }
    }

    if (invocation.cancelled()) return "interrupted after " + std::to_string(spoken) + " sentence(s)";
    std::string rest = domain::Trim(pending);
    if (!rest.empty()) {
        say(rest, speakerId);
        ++spoken;
    }
    return "spoke " + std::to_string(spoken) + " sentence(s)";
}

void SpeakMotor::say(const std::string& sentence, const std::string& speakerId) {
    if (m_ttsUrl.empty()) {
        std::cout << "[Speak] " << sentence << std::endl;
        return;
    }

    httplib::Client cli(m_ttsUrl);
    auto ms = m_timeout.count();
    cli.set_read_timeout(static_cast<time_t>(ms / 1000), static_cast<time_t>((ms % 1000) * 1000));

    httplib::Params params{{"text", sentence}, {"speaker_id", speakerId}};
    auto res = cli.Get("/api/tts", params, httplib::Headers{});
    if (!res) {
        throw std::runtime_error("TTS connection failed (error " + std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status != 200) {
        throw std::runtime_error("TTS returned HTTP " + std::to_string(res->status));
    }
    std::cout << "[Speak] " << sentence << " (" << res->body.size() << " bytes of audio)" << std::endl;
}

} // namespace psyche::infrastructure
