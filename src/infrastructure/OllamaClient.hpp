/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace psyche::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434,
                 std::chrono::milliseconds readTimeout = std::chrono::seconds(60));

    /**
     * @brief Streams a POST to /api/chat, forwarding each content fragment.
     * @param onToken Returning false aborts the request.
     * @return true once the server reported "done"; false on any error or abort.
     */
    bool chatStream(const std::string& model,
                    const nlohmann::json& messages,
                    const std::function<bool(const std::string&)>& onToken);

    /** @brief Sends a POST request to /api/embeddings. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    std::chrono::milliseconds m_readTimeout;
};

} // namespace psyche::infrastructure
