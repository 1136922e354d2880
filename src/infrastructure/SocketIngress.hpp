/**
 * @file SocketIngress.hpp
 * @brief Unix domain socket accepting framed sensations from sensor processes.
 *
 * Frame: first line is the path (e.g. "/chat"), following lines are the text,
 * and a line containing only "---" ends the frame. Several frames may share a
 * connection.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace psyche::infrastructure {

struct IngressFrame {
    int clientFd = -1;
    std::string path;
    std::string text;
};

class SocketIngress {
public:
    static constexpr int kMaxConnections = 32;
    static constexpr size_t kMaxFrameSize = 1024 * 1024;

    explicit SocketIngress(std::string socketPath);
    ~SocketIngress();

    SocketIngress(const SocketIngress&) = delete;
    SocketIngress& operator=(const SocketIngress&) = delete;

    /** @brief Binds and listens, replacing a stale socket file. */
    bool start();
    void stop();
    bool running() const { return m_serverFd >= 0; }

    /**
     * @brief Waits up to timeoutMs for activity and returns completed frames.
     * A connection whose pending frame exceeds kMaxFrameSize is closed.
     */
    std::vector<IngressFrame> poll(int timeoutMs = 100);

    size_t connectionCount() const { return m_connections.size(); }
    const std::string& socketPath() const { return m_socketPath; }

    /**
     * @brief Removes every complete frame from the front of the buffer.
     * @return (path, text) pairs; the path always starts with '/'.
     */
    static std::vector<std::pair<std::string, std::string>> ExtractFrames(std::string& buffer);

private:
    struct Connection {
        int fd = -1;
        std::string buffer;
        bool wantsClose = false;
    };

    bool createSocket();
    void acceptConnections();
    void closeFinished();

    std::string m_socketPath;
    int m_serverFd = -1;
    std::vector<Connection> m_connections;
};

} // namespace psyche::infrastructure
