#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/EventBus.hpp"
#include "application/MemoryService.hpp"
#include "application/Router.hpp"
#include "application/SensationIngestor.hpp"
#include "domain/Identifiers.hpp"
#include "infrastructure/MemoryStoreFs.hpp"
#include "infrastructure/SocketIngress.hpp"

using namespace psyche;
namespace fs = std::filesystem;

namespace {

int Connect(const std::string& path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    assert(fd >= 0);
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int rc = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    return fd;
}

void Send(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = write(fd, data.data() + sent, data.size() - sent);
        assert(n > 0);
        sent += static_cast<size_t>(n);
    }
}

std::vector<infrastructure::IngressFrame> PollFor(infrastructure::SocketIngress& ingress, size_t want) {
    std::vector<infrastructure::IngressFrame> frames;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (frames.size() < want && std::chrono::steady_clock::now() < deadline) {
        for (auto& frame : ingress.poll(50)) frames.push_back(std::move(frame));
    }
    return frames;
}

} // namespace

void TestExtractFrames() {
    std::cout << "[Test] TestExtractFrames..." << std::endl;
    std::string buffer = "chat\nHello\nworld\n---\n /vision \r\nA cat sits.\r\n---\r\n/partial\nnot done";
    auto frames = infrastructure::SocketIngress::ExtractFrames(buffer);

    assert(frames.size() == 2);
    assert(frames[0].first == "/chat");
    assert(frames[0].second == "Hello\nworld");
    assert(frames[1].first == "/vision");
    assert(frames[1].second == "A cat sits.");
    assert(buffer == "/partial\nnot done");

    buffer += "\n---\n";
    frames = infrastructure::SocketIngress::ExtractFrames(buffer);
    assert(frames.size() == 1);
    assert(frames[0].second == "not done");
    assert(buffer.empty());

    // "---" inside a line is text, not a terminator.
    buffer = "/chat\nwait --- for it\n---\n";
    frames = infrastructure::SocketIngress::ExtractFrames(buffer);
    assert(frames.size() == 1 && frames[0].second == "wait --- for it");

    std::cout << "[PASS] TestExtractFrames" << std::endl;
}

void TestSocketRoundTrip() {
    std::cout << "[Test] TestSocketRoundTrip..." << std::endl;
    std::string path = (fs::temp_directory_path() / ("psyche_" + domain::GenerateId().substr(0, 8) + ".sock")).string();
    infrastructure::SocketIngress ingress(path);
    assert(ingress.start());
    assert(fs::exists(path));

    int a = Connect(path);
    int b = Connect(path);
    Send(a, "/chat\nhi from a\n---\n/chat\nsecond from a\n");
    Send(b, "/hearing\nhi from b\n---\n");
    Send(a, "---\n");

    auto frames = PollFor(ingress, 3);
    assert(frames.size() == 3);
    int fromA = 0;
    for (const auto& frame : frames) {
        if (frame.path == "/chat") ++fromA;
        if (frame.path == "/hearing") assert(frame.text == "hi from b");
    }
    assert(fromA == 2);
    assert(ingress.connectionCount() == 2);

    close(a);
    close(b);
    for (int i = 0; i < 100 && ingress.connectionCount() > 0; ++i) ingress.poll(10);
    assert(ingress.connectionCount() == 0);

    ingress.stop();
    assert(!fs::exists(path));
    std::cout << "[PASS] TestSocketRoundTrip" << std::endl;
}

void TestOversizedFrameClosesConnection() {
    std::cout << "[Test] TestOversizedFrameClosesConnection..." << std::endl;
    std::string path = (fs::temp_directory_path() / ("psyche_" + domain::GenerateId().substr(0, 8) + ".sock")).string();
    infrastructure::SocketIngress ingress(path);
    assert(ingress.start());

    int fd = Connect(path);
    std::string huge = "/chat\n" + std::string(infrastructure::SocketIngress::kMaxFrameSize + 10, 'x');
    // The server drops the connection part way, so writes may fail.
    size_t sent = 0;
    bool accepted = false;
    bool dropped = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!dropped && std::chrono::steady_clock::now() < deadline) {
        if (sent < huge.size()) {
            ssize_t n = send(fd, huge.data() + sent, huge.size() - sent, MSG_DONTWAIT | MSG_NOSIGNAL);
            if (n > 0) sent += static_cast<size_t>(n);
        }
        ingress.poll(10);
        if (ingress.connectionCount() > 0) {
            accepted = true;
        } else if (accepted) {
            dropped = true;
        }
    }
    assert(dropped);

    close(fd);
    std::cout << "[PASS] TestOversizedFrameClosesConnection" << std::endl;
}

void TestIngestorDedupAndEmpty() {
    std::cout << "[Test] TestIngestorDedupAndEmpty..." << std::endl;
    auto store = std::make_shared<infrastructure::MemoryStoreFs>("", nullptr);
    auto router = std::make_shared<application::Router>();
    auto bus = std::make_shared<application::EventBus>();
    router->addRoute("sensation", "quick");
    auto quick = router->queueFor("quick");

    int published = 0;
    bus->subscribe([&](const application::RuntimeEvent&) { ++published; }, "sensation");

    application::SensationIngestor ingestor("", router, bus);
    application::UnitContext context;
    context.memory = std::make_shared<application::MemoryService>(store, std::chrono::milliseconds(60000));

    assert(ingestor.ingest("/chat", "Is anyone there?", "socket", context));
    assert(!ingestor.ingest("/chat", "Is anyone there?", "socket", context));
    assert(!ingestor.ingest("/chat", "   \n", "socket", context));
    assert(ingestor.ingest("/vision", "Is anyone there?", "socket", context));

    assert(quick->size() == 2);
    auto first = quick->tryPop();
    assert(first->kind == "sensation/chat");
    assert(first->source == "socket");
    assert(quick->tryPop()->kind == "sensation/vision");
    assert(published == 2);
    assert(store->ofKind(domain::kinds::Sensation).size() == 2);

    std::cout << "[PASS] TestIngestorDedupAndEmpty" << std::endl;
}

int main() {
    TestExtractFrames();
    TestSocketRoundTrip();
    TestOversizedFrameClosesConnection();
    TestIngestorDedupAndEmpty();
    std::cout << "All ingress tests passed." << std::endl;
    return 0;
}
