#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "domain/AIService.hpp"

// Language model double: replays scripted replies token by token.
class ScriptedAIService : public psyche::domain::AIService {
public:
    struct Reply {
        std::vector<std::string> tokens;
        bool ok = true;
        std::chrono::milliseconds tokenDelay{0};
    };

    using Responder = std::function<Reply(const std::vector<ChatMessage>&)>;

    static Reply Text(const std::string& text, size_t chunkSize = 4) {
        Reply reply;
        for (size_t i = 0; i < text.size(); i += chunkSize) {
            reply.tokens.push_back(text.substr(i, chunkSize));
        }
        return reply;
    }

    static Reply Failure() {
        Reply reply;
        reply.ok = false;
        return reply;
    }

    void enqueue(Reply reply) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.push_back(std::move(reply));
    }

    // Used once the script is exhausted.
    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responder = std::move(responder);
    }

    bool streamChat(const std::vector<ChatMessage>& history, const TokenCallback& onToken) override {
        Reply reply;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_calls;
            m_prompts.push_back(history);
            if (!m_script.empty()) {
                reply = m_script.front();
                m_script.pop_front();
            } else if (m_responder) {
                reply = m_responder(history);
            } else {
                reply = Failure();
            }
        }
        for (const auto& token : reply.tokens) {
            if (reply.tokenDelay.count() > 0) std::this_thread::sleep_for(reply.tokenDelay);
            if (!onToken(token)) return false;
        }
        return reply.ok;
    }

    std::vector<float> getEmbedding(const std::string&) override {
        return {};
    }

    std::string getCurrentModel() const override { return "scripted"; }

    int calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    std::vector<std::vector<ChatMessage>> prompts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_prompts;
    }

private:
    mutable std::mutex m_mutex;
    std::deque<Reply> m_script;
    Responder m_responder;
    int m_calls = 0;
    std::vector<std::vector<ChatMessage>> m_prompts;
};
