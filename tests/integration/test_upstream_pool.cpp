#include "webgate/ProxyServer.h"
#include "webgate/common/Logger.h"
#include "webgate/network/EventLoop.h"
#include "webgate/upstream/UpstreamConnectionPool.h"
#include "TestUtil.h"

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using webgate::network::EventLoop;
using webgate::upstream::UpstreamConnectionPool;
using namespace testutil;

namespace {

std::atomic<int> g_inFlight{0};
std::atomic<int> g_maxInFlight{0};

bool handleOrigin(int fd, const OriginRequest& req) {
    if (req.target == "/slow") {
        const int now = ++g_inFlight;
        int seen = g_maxInFlight.load();
        while (now > seen && !g_maxInFlight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        --g_inFlight;
        sendAll(fd, makeResponse(200, "OK", "Content-Type: text/plain\r\n", "slow"));
        return true;
    }
    if (req.target == "/close") {
        sendAll(fd, makeResponse(200, "OK", "Connection: close\r\n", "bye"));
        return false;
    }
    sendAll(fd, makeResponse(200, "OK", "Content-Type: text/plain\r\n", "pooled"));
    return true;
}

std::string fetchStatus(uint16_t port, const std::string& host, const std::string& path, std::string* head) {
    int fd = connectTo(port);
    assert(fd >= 0);
    sendAll(fd, "GET /proxy/http://" + host + path + " HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
    std::string body;
    assert(readResponse(fd, head, &body, 3000));
    ::close(fd);
    return body;
}

std::string fetch(uint16_t port, const std::string& path) {
    std::string head;
    const std::string body = fetchStatus(port, "origin.test", path, &head);
    assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
    return body;
}

template <typename Pred>
bool waitFor(Pred pred, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

void testKeepAliveReuse(uint16_t port, LoopbackOrigin& origin, UpstreamConnectionPool* pool) {
    const std::string key = UpstreamConnectionPool::OriginKey("origin.test", 80);
    assert(fetch(port, "/a") == "pooled");
    assert(waitFor([&]() { return pool->IdleCount(key) == 1; }, 1000));
    assert(fetch(port, "/b") == "pooled");
    assert(origin.accepted() == 1);
    assert(waitFor([&]() { return pool->IdleCount(key) == 1 && pool->ActiveCount(key) == 0; }, 1000));
    LOG_INFO << "Keep-alive reuse PASS";
}

void testCapQueuesWaiters(uint16_t port, LoopbackOrigin& origin, UpstreamConnectionPool* pool) {
    const std::string key = UpstreamConnectionPool::OriginKey("origin.test", 80);
    std::string second;
    std::thread first([&]() { assert(fetch(port, "/slow") == "slow"); });
    // The first request holds the only socket while the origin sleeps.
    assert(waitFor([]() { return g_inFlight.load() == 1; }, 1000));
    std::thread other([&]() { second = fetch(port, "/slow"); });
    assert(waitFor([&]() { return pool->WaiterCount(key) == 1; }, 300));
    first.join();
    other.join();
    assert(second == "slow");
    assert(g_maxInFlight.load() == 1);
    // The waiter got the released connection instead of a new one.
    assert(origin.accepted() == 1);
    LOG_INFO << "Cap queues waiters PASS";
}

void testAbandonedWaiterGivesUpItsPlace(uint16_t port, LoopbackOrigin& origin, UpstreamConnectionPool* pool) {
    const std::string key = UpstreamConnectionPool::OriginKey("origin.test", 80);
    const int acceptedBefore = origin.accepted();
    std::thread first([&]() { assert(fetch(port, "/slow") == "slow"); });
    assert(waitFor([]() { return g_inFlight.load() == 1; }, 1000));

    // Queued behind the cap, then the client gives up.
    int fd = connectTo(port);
    assert(fd >= 0);
    sendAll(fd, "GET /proxy/http://origin.test/slow HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(waitFor([&]() { return pool->WaiterCount(key) == 1; }, 300));
    ::close(fd);
    assert(waitFor([&]() { return pool->WaiterCount(key) == 0; }, 300));

    first.join();
    // The released connection went back to idle instead of to the departed client.
    assert(waitFor([&]() { return pool->IdleCount(key) == 1 && pool->ActiveCount(key) == 0; }, 1000));
    assert(origin.accepted() == acceptedBefore);
    assert(g_maxInFlight.load() == 1);
    LOG_INFO << "Abandoned waiter gives up its place PASS";
}

void testCloseIsNotPooled(uint16_t port, LoopbackOrigin& origin, UpstreamConnectionPool* pool) {
    const std::string key = UpstreamConnectionPool::OriginKey("origin.test", 80);
    assert(fetch(port, "/close") == "bye");
    assert(waitFor([&]() { return pool->IdleCount(key) == 0 && pool->ActiveCount(key) == 0; }, 1000));
    assert(fetch(port, "/c") == "pooled");
    assert(origin.accepted() == 2);
    LOG_INFO << "Close is not pooled PASS";
}

void testOriginsForgottenWhenUnused(uint16_t port, UpstreamConnectionPool* pool) {
    // origin.test still holds an idle connection.
    assert(waitFor([&]() { return pool->OriginCount() == 1; }, 1000));
    for (const char* host : {"a1.test", "a2.test", "a3.test"}) {
        std::string head;
        assert(fetchStatus(port, host, "/close", &head) == "bye");
        assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
    }
    std::string head;
    fetchStatus(port, "dead.test", "/", &head);
    assert(head.find("HTTP/1.1 502 ") == 0);
    // Closed and refused origins leave nothing behind.
    assert(waitFor([&]() { return pool->OriginCount() == 1; }, 1000));
    assert(pool->ActiveCount(UpstreamConnectionPool::OriginKey("a1.test", 80)) == 0);
    LOG_INFO << "Origins forgotten when unused PASS";
}

void testIdleClosedByOrigin(UpstreamConnectionPool* pool, LoopbackOrigin& origin) {
    const std::string key = UpstreamConnectionPool::OriginKey("origin.test", 80);
    assert(waitFor([&]() { return pool->IdleCount(key) == 1; }, 1000));
    // Stopping the origin closes its side of every pooled connection.
    origin.Stop();
    assert(waitFor([&]() { return pool->IdleCount(key) == 0; }, 2000));
    assert(waitFor([&]() { return pool->OriginCount() == 0; }, 1000));
    LOG_INFO << "Idle closed by origin PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    webgate::common::Logger::Instance().SetLevel(webgate::common::LogLevel::ERROR);

    LoopbackOrigin origin(handleOrigin);
    assert(origin.Start());
    const auto deadPort = reserveFreePort();
    assert(deadPort.has_value());
    const std::string originAddr = "=127.0.0.1:" + std::to_string(origin.port());

    webgate::ProxyOptions options;
    options.port = 0;
    options.loopbackOnly = true;
    // One I/O loop: idle connections are kept per loop.
    options.threads = 1;
    options.maxSockets = 1;
    options.resolve = {"origin.test:80" + originAddr, "a1.test:80" + originAddr, "a2.test:80" + originAddr,
                       "a3.test:80" + originAddr, "dead.test:80=127.0.0.1:" + std::to_string(*deadPort)};

    EventLoop loop;
    webgate::ProxyServer server(&loop, options);
    assert(server.Start());
    const uint16_t proxyPort = server.listenAddress().toPort();
    UpstreamConnectionPool* pool = server.plainPool();
    assert(UpstreamConnectionPool::OriginKey("Origin.TEST", 80) == "origin.test:80");
    assert(pool->ActiveCount("origin.test:80") == 0);
    assert(pool->OriginCount() == 0);
    assert(server.resolver().numThreads() == options.resolverThreads);

    std::thread client([&]() {
        testKeepAliveReuse(proxyPort, origin, pool);
        testCapQueuesWaiters(proxyPort, origin, pool);
        testAbandonedWaiterGivesUpItsPlace(proxyPort, origin, pool);
        testCloseIsNotPooled(proxyPort, origin, pool);
        testOriginsForgottenWhenUnused(proxyPort, pool);
        testIdleClosedByOrigin(pool, origin);
        loop.QueueInLoop([&]() { server.Stop(); });
    });

    loop.Loop();
    client.join();
    origin.Stop();
    return 0;
}
