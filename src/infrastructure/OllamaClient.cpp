#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace psyche::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kTemperature = 0.7;
constexpr size_t kMaxLineBytes = 1 << 20;

void ApplyTimeout(httplib::Client& cli, std::chrono::milliseconds timeout) {
    auto ms = timeout.count();
    cli.set_read_timeout(static_cast<time_t>(ms / 1000), static_cast<time_t>((ms % 1000) * 1000));
}
}

OllamaClient::OllamaClient(const std::string& host, int port, std::chrono::milliseconds readTimeout)
    : m_host(host), m_port(port), m_readTimeout(readTimeout) {}

bool OllamaClient::chatStream(const std::string& model,
                              const json& messages,
                              const std::function<bool(const std::string&)>& onToken) {
    httplib::Client cli(m_host, m_port);
    ApplyTimeout(cli, m_readTimeout);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", true},
        {"options", {
            {"temperature", kTemperature}
        }}
    };

    std::string pending;
    bool done = false;
    bool failed = false;
    bool aborted = false;

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/chat";
    req.headers = {{"Content-Type", "application/json"}};
    req.body = requestData.dump();
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        pending.append(data, len);
        if (pending.size() > kMaxLineBytes) {
            std::cerr << "[OllamaClient] Stream line exceeds " << kMaxLineBytes << " bytes" << std::endl;
            failed = true;
            return false;
        }

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (line.empty()) continue;

            try {
                auto chunk = json::parse(line);
                if (chunk.contains("error")) {
                    std::cerr << "[OllamaClient] Server error: " << chunk["error"].dump() << std::endl;
                    failed = true;
                    return false;
                }
                if (chunk.contains("message") && chunk["message"].contains("content")) {
                    std::string token = chunk["message"]["content"].get<std::string>();
                    if (!token.empty() && !onToken(token)) {
                        aborted = true;
                        return false;
                    }
                }
                if (chunk.value("done", false)) {
                    done = true;
                }
            } catch (const std::exception& e) {
                std::cerr << "[OllamaClient] Stream JSON Parse Error: " << e.what() << std::endl;
                failed = true;
                return false;
            }
        }
        return true;
    };

    auto res = cli.send(req);
    if (aborted) return false;
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        return false;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << pending << std::endl;
        return false;
    }
    if (failed) return false;
    if (!done) {
        std::cerr << "[OllamaClient] Stream ended before completion" << std::endl;
        return false;
    }
    return true;
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    ApplyTimeout(cli, m_readTimeout);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("embedding") && body["embedding"].is_array()) {
                return body["embedding"].get<std::vector<float>>();
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OllamaClient] Embedding HTTP Error " << res->status << std::endl;
    }
    return {};
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace psyche::infrastructure
