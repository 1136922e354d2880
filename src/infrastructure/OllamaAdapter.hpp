/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "domain/AIService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <chrono>
#include <string>

namespace psyche::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements AIService using the Ollama REST API.
 *
 * One adapter per unit: instances hold no shared state.
 */
class OllamaAdapter : public domain::AIService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Chat model; empty selects one from /api/tags on initialize().
     * @param embeddingModel Model for /api/embeddings; empty reuses the chat model.
     * @param timeout Read timeout of each HTTP call.
     */
    OllamaAdapter(const std::string& host = "localhost", int port = 11434,
                  const std::string& model = "", const std::string& embeddingModel = "",
                  std::chrono::milliseconds timeout = std::chrono::seconds(60));

    /** @brief Picks a model when none was configured. */
    void initialize() override;

    /** @brief Streams a chat reply. @see domain::AIService::streamChat */
    bool streamChat(const std::vector<ChatMessage>& history, const TokenCallback& onToken) override;

    /** @brief Generates a semantic embedding vector. @see domain::AIService::getEmbedding */
    std::vector<float> getEmbedding(const std::string& text) override;

    std::string getCurrentModel() const override { return m_model; }

private:
    void detectBestModel();

    OllamaClient m_client;
    std::string m_model; ///< Target model name.
    std::string m_embeddingModel;
};

} // namespace psyche::infrastructure
