/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace psyche::infrastructure {

namespace {
const char* kDefaultModel = "llama3";
}

OllamaAdapter::OllamaAdapter(const std::string& host, int port,
                             const std::string& model, const std::string& embeddingModel,
                             std::chrono::milliseconds timeout)
    : m_client(host, port, timeout), m_model(model), m_embeddingModel(embeddingModel) {}

void OllamaAdapter::initialize() {
    if (m_model.empty()) {
        detectBestModel();
    }
}

void OllamaAdapter::detectBestModel() {
    auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        m_model = kDefaultModel;
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Using default: " << m_model << std::endl;
        return;
    }

    // Priority Hierarchy
    const std::vector<std::string> priorities = {
        "gemma3",
        "llama3",
        "qwen2.5",
        "mistral",
        "gemma"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                m_model = model;
                std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }

    // Fallback: Pick the first available
    m_model = availableModels[0];
    std::cout << "[OllamaAdapter] Fallback model: " << m_model << std::endl;
}

bool OllamaAdapter::streamChat(const std::vector<ChatMessage>& history, const TokenCallback& onToken) {
    if (m_model.empty()) detectBestModel();

    json messages = json::array();
    for (const auto& msg : history) {
        messages.push_back({
            {"role", ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    return m_client.chatStream(m_model, messages, onToken);
}

std::vector<float> OllamaAdapter::getEmbedding(const std::string& text) {
    const std::string& model = m_embeddingModel.empty() ? m_model : m_embeddingModel;
    if (model.empty()) return {};
    return m_client.getEmbedding(model, text);
}

} // namespace psyche::infrastructure
