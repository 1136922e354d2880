/**
 * @file SpeakMotor.hpp
 * @brief Streams speech sentence by sentence to a text-to-speech server.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "domain/Motor.hpp"

namespace psyche::infrastructure {

/**
 * @class SpeakMotor
 * @brief Exclusive streaming motor: a newer <speak> cuts off the current one.
 *
 * Each complete sentence is sent to `GET <ttsUrl>/api/tts?text=...&speaker_id=...`
 * as soon as it has streamed in. With an empty URL the motor is silent and
 * only logs what it would say.
 */
class SpeakMotor : public domain::Motor {
public:
    explicit SpeakMotor(std::string ttsUrl = "", std::string speakerId = "p300",
                        std::chrono::milliseconds timeout = std::chrono::seconds(30));

    domain::MotorSchema schema() const override;

    /** @throws std::runtime_error when the TTS server rejects a sentence. */
    std::string perform(domain::MotorInvocation& invocation) override;

    /** @brief Removes and returns the first complete sentence of `pending`, if any. */
    static std::optional<std::string> TakeSentence(std::string& pending);

private:
    void say(const std::string& sentence, const std::string& speakerId);

    std::string m_ttsUrl;
    std::string m_speakerId;
    std::chrono::milliseconds m_timeout;
};

} // namespace psyche::infrastructure
