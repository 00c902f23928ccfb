#include "webgate/ProxyServer.h"
#include "webgate/common/Logger.h"
#include "webgate/network/EventLoop.h"
#include "TestUtil.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using webgate::network::EventLoop;
using namespace testutil;

namespace {

std::atomic<bool> g_stopEcho{false};

const char kHandshake101[] =
    "HTTP/1.1 101 Switching Protocols\r\n"
    "Upgrade: websocket\r\n"
    "Connection: Upgrade\r\n"
    "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n";

bool handleOrigin(int fd, const OriginRequest& req) {
    if (req.target == "/ws") {
        sendAll(fd, kHandshake101);
        // Raw echo once switched.
        while (!g_stopEcho.load()) {
            if (!pollReadable(fd, 50)) continue;
            char buf[16384];
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            sendAll(fd, std::string(buf, static_cast<size_t>(n)));
        }
        return false;
    }
    if (req.target == "/ws-refuse") {
        sendAll(fd, makeResponse(403, "Forbidden", "Content-Type: text/plain\r\n", "not ok"));
        return true;
    }
    sendAll(fd, makeResponse(404, "Not Found", "", ""));
    return true;
}

std::string upgradeRequest(const std::string& target) {
    return "GET /proxy/" + target + " HTTP/1.1\r\n"
           "Host: 127.0.0.1\r\n"
           "Connection: Upgrade\r\n"
           "Upgrade: websocket\r\n"
           "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
           "Sec-WebSocket-Version: 13\r\n\r\n";
}

// Reads through the blank line ending a response head; extra bytes go to *rest.
bool readHead(int fd, std::string* head, std::string* rest, int timeoutMs = 3000) {
    std::string got;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    size_t end;
    while ((end = got.find("\r\n\r\n")) == std::string::npos) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        got += recvSome(fd, 50);
    }
    *head = got.substr(0, end + 4);
    *rest = got.substr(end + 4);
    return true;
}

std::string readExactly(int fd, size_t want, std::string have, int timeoutMs = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (have.size() < want && std::chrono::steady_clock::now() < deadline) {
        have += recvSome(fd, 50);
    }
    return have;
}

} // namespace

void testUpgradeSplices(uint16_t port, LoopbackOrigin& origin) {
    int fd = connectTo(port);
    assert(fd >= 0);
    sendAll(fd, upgradeRequest("http://origin.test/ws"));

    std::string head, rest;
    assert(readHead(fd, &head, &rest));
    // The handshake answer is relayed verbatim.
    assert(head == kHandshake101);

    const OriginRequest req = origin.requests().back();
    assert(req.target == "/ws");
    assert(headerValue(req.head, "Upgrade") == "websocket");
    assert(headerValue(req.head, "Connection") == "Upgrade");
    assert(headerValue(req.head, "Sec-WebSocket-Key") == "dGhlIHNhbXBsZSBub25jZQ==");
    assert(headerValue(req.head, "Host") == "origin.test");

    sendAll(fd, "ping-1");
    assert(readExactly(fd, 6, rest) == "ping-1");

    // Large enough to cross the high-water mark in both directions.
    std::string big(256 * 1024, 'w');
    for (size_t i = 0; i < big.size(); i += 1024) big[i] = static_cast<char>('a' + (i / 1024) % 26);
    std::thread writer([fd, &big]() { sendAll(fd, big); });
    const std::string echoed = readExactly(fd, big.size(), std::string(), 10000);
    writer.join();
    assert(echoed == big);

    ::close(fd);
    // Client gone: the upstream side is closed too.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (origin.open() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(origin.open() == 0);
    LOG_INFO << "Upgrade splices PASS";
}

void testRefusedUpgradeRelayedThenClosed(uint16_t port) {
    int fd = connectTo(port);
    assert(fd >= 0);
    sendAll(fd, upgradeRequest("http://origin.test/ws-refuse"));
    std::string head, body;
    assert(readResponse(fd, &head, &body, 3000));
    assert(head.find("HTTP/1.1 403 Forbidden\r\n") == 0);
    assert(body == "not ok");
    assert(waitClosed(fd));
    ::close(fd);
    LOG_INFO << "Refused upgrade relayed then closed PASS";
}

void testUpgradeToUnreachableOrigin(uint16_t port) {
    int fd = connectTo(port);
    assert(fd >= 0);
    sendAll(fd, upgradeRequest("http://dead.test/ws"));
    std::string head, body;
    assert(readResponse(fd, &head, &body, 3000));
    assert(head.find("HTTP/1.1 502 ") == 0);
    assert(waitClosed(fd));
    ::close(fd);
    LOG_INFO << "Upgrade to unreachable origin PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    webgate::common::Logger::Instance().SetLevel(webgate::common::LogLevel::ERROR);

    LoopbackOrigin origin(handleOrigin);
    assert(origin.Start());
    const auto deadPort = reserveFreePort();
    assert(deadPort.has_value());

    webgate::ProxyOptions options;
    options.port = 0;
    options.loopbackOnly = true;
    options.threads = 2;
    options.tunnelHighWaterBytes = 64 * 1024;
    options.resolve = {
        "origin.test:80=127.0.0.1:" + std::to_string(origin.port()),
        "dead.test:80=127.0.0.1:" + std::to_string(*deadPort),
    };

    EventLoop loop;
    webgate::ProxyServer server(&loop, options);
    assert(server.Start());
    const uint16_t proxyPort = server.listenAddress().toPort();

    std::thread client([&]() {
        testUpgradeSplices(proxyPort, origin);
        testRefusedUpgradeRelayedThenClosed(proxyPort);
        testUpgradeToUnreachableOrigin(proxyPort);
        loop.QueueInLoop([&]() { server.Stop(); });
    });

    loop.Loop();
    client.join();
    g_stopEcho = true;
    origin.Stop();
    return 0;
}
