#include "infrastructure/SocketIngress.hpp"
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace psyche::infrastructure {

namespace {

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::string StripCarriageReturn(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace

SocketIngress::SocketIngress(std::string socketPath)
    : m_socketPath(std::move(socketPath)) {}

SocketIngress::~SocketIngress() {
    stop();
}

bool SocketIngress::start() {
    if (m_serverFd >= 0) return true;
    if (!createSocket()) return false;
    std::cout << "[SocketIngress] Listening on " << m_socketPath << std::endl;
    return true;
}

void SocketIngress::stop() {
    for (auto& conn : m_connections) {
        if (conn.fd >= 0) close(conn.fd);
    }
    m_connections.clear();

    if (m_serverFd >= 0) {
        close(m_serverFd);
        m_serverFd = -1;
        unlink(m_socketPath.c_str());
    }
}

bool SocketIngress::createSocket() {
    struct sockaddr_un addr;
    if (m_socketPath.size() >= sizeof(addr.sun_path)) {
        std::cerr << "[SocketIngress] Socket path too long: " << m_socketPath << std::endl;
        return false;
    }

    unlink(m_socketPath.c_str());

    m_serverFd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (m_serverFd < 0) {
        std::cerr << "[SocketIngress] socket() failed: " << strerror(errno) << std::endl;
        return false;
    }
    SetNonBlocking(m_serverFd);

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, m_socketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(m_serverFd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[SocketIngress] bind() failed: " << strerror(errno) << std::endl;
        close(m_serverFd);
        m_serverFd = -1;
        return false;
    }

    chmod(m_socketPath.c_str(), 0600);

    if (listen(m_serverFd, kMaxConnections) < 0) {
        std::cerr << "[SocketIngress] listen() failed: " << strerror(errno) << std::endl;
        close(m_serverFd);
        m_serverFd = -1;
        unlink(m_socketPath.c_str());
        return false;
    }
    return true;
}

std::vector<IngressFrame> SocketIngress::poll(int timeoutMs) {
    std::vector<IngressFrame> frames;
    if (m_serverFd < 0) return frames;

    std::vector<pollfd> fds;
    fds.reserve(1 + m_connections.size());
    fds.push_back({m_serverFd, POLLIN, 0});
    for (const auto& conn : m_connections) {
        fds.push_back({conn.fd, POLLIN, 0});
    }

    int ret = ::poll(fds.data(), fds.size(), timeoutMs);
    if (ret < 0) {
        if (errno != EINTR) {
            std::cerr << "[SocketIngress] poll() error: " << strerror(errno) << std::endl;
        }
        return frames;
    }
    if (ret == 0) return frames;

    if (fds[0].revents & POLLIN) {
        acceptConnections();
    }

    for (size_t i = 1; i < fds.size() && i - 1 < m_connections.size(); ++i) {
        auto& conn = m_connections[i - 1];

        if (fds[i].revents & POLLIN) {
            char buf[4096];
            ssize_t n = read(conn.fd, buf, sizeof(buf));
            if (n > 0) {
                conn.buffer.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                conn.wantsClose = true;
            }
        } else if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            conn.wantsClose = true;
        }

        for (auto& [path, text] : ExtractFrames(conn.buffer)) {
            frames.push_back({conn.fd, std::move(path), std::move(text)});
        }

        if (conn.buffer.size() > kMaxFrameSize) {
            std::cerr << "[SocketIngress] Frame larger than " << kMaxFrameSize << " bytes, closing fd=" << conn.fd << std::endl;
            conn.wantsClose = true;
        }
    }

    closeFinished();
    return frames;
}

std::vector<std::pair<std::string, std::string>> SocketIngress::ExtractFrames(std::string& buffer) {
    std::vector<std::pair<std::string, std::string>> frames;

    while (true) {
        size_t pathEnd = buffer.find('\n');
        if (pathEnd == std::string::npos) break;

        // Find a terminator line after the path line.
        size_t lineStart = pathEnd + 1;
        size_t terminator = std::string::npos;
        size_t frameEnd = 0;
        while (lineStart <= buffer.size()) {
            size_t lineEnd = buffer.find('\n', lineStart);
            if (lineEnd == std::string::npos) break;
            if (StripCarriageReturn(buffer.substr(lineStart, lineEnd - lineStart)) == "---") {
                terminator = lineStart;
                frameEnd = lineEnd + 1;
                break;
            }
            lineStart = lineEnd + 1;
        }
        if (terminator == std::string::npos) break;

        std::string path = StripCarriageReturn(buffer.substr(0, pathEnd));
        path.erase(0, path.find_first_not_of(" \t"));
        path.erase(path.find_last_not_of(" \t") + 1);
        if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');

        std::string text = buffer.substr(pathEnd + 1, terminator - (pathEnd + 1));
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();

        frames.emplace_back(std::move(path), std::move(text));
        buffer.erase(0, frameEnd);
    }
    return frames;
}

void SocketIngress::acceptConnections() {
    while (true) {
        int clientFd = accept(m_serverFd, nullptr, nullptr);
        if (clientFd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::cerr << "[SocketIngress] accept() error: " << strerror(errno) << std::endl;
            }
            break;
        }

        if (m_connections.size() >= static_cast<size_t>(kMaxConnections)) {
            std::cerr << "[SocketIngress] Max connections reached, rejecting" << std::endl;
            close(clientFd);
            continue;
        }

        SetNonBlocking(clientFd);
        m_connections.push_back({clientFd, "", false});
    }
}

void SocketIngress::closeFinished() {
    auto it = std::remove_if(m_connections.begin(), m_connections.end(), [](const Connection& conn) {
        if (conn.wantsClose) {
            close(conn.fd);
            return true;
        }
        return false;
    });
    m_connections.erase(it, m_connections.end());
}

} // namespace psyche::infrastructure
