#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/TcpClient.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace webgate {
namespace network {
class Resolver;
class TlsContext;
} // namespace network

namespace upstream {

// Keep-alive connections to origins, one in-flight request per connection.
// At most maxSockets connections per origin (host:port) are leased or connecting at a
// time; further acquisitions wait in FIFO order. Idle connections stay on the loop that
// created them and are only handed to requests on that loop.
class UpstreamConnectionPool : webgate::common::noncopyable {
public:
    struct Config {
        std::string name{"pool"};
        size_t maxSockets{50};
        size_t maxIdlePerOrigin{8};
        double connectTimeoutSec{120.0};
    };

    class Lease : webgate::common::noncopyable {
    public:
        Lease(webgate::network::EventLoop* loop,
              std::string originKey,
              std::shared_ptr<webgate::network::TcpClient> client,
              UpstreamConnectionPool* pool,
              bool reused);
        // Releases without keep-alive if the holder never did.
        ~Lease();

        webgate::network::TcpConnectionPtr connection() const;
        const std::string& originKey() const { return originKey_; }
        bool reused() const { return reused_; }

        // keepAlive=true returns the connection to the idle list; otherwise it is closed.
        void Release(bool keepAlive);

    private:
        webgate::network::EventLoop* loop_;
        std::string originKey_;
        std::shared_ptr<webgate::network::TcpClient> client_;
        UpstreamConnectionPool* pool_;
        bool reused_;
        bool released_{false};
    };

    using LeasePtr = std::shared_ptr<Lease>;
    // lease is null on failure and error says why. Always invoked on the acquiring loop.
    using AcquireCallback = std::function<void(LeasePtr lease, const std::string& error)>;
    // Identifies one Acquire call; never 0.
    using Ticket = uint64_t;

    // tls may be null for the plain pool. resolver and tls must outlive the pool.
    UpstreamConnectionPool(Config cfg, webgate::network::Resolver* resolver, webgate::network::TlsContext* tls);
    ~UpstreamConnectionPool();

    // Call on loop's thread. host is used for DNS, SNI and the origin key.
    Ticket Acquire(webgate::network::EventLoop* loop, const std::string& host, uint16_t port, AcquireCallback cb);
    // Withdraws an acquisition still queued behind the cap; its callback is never invoked.
    // Returns false when it was already served (the lease then arrives as usual).
    bool Cancel(const std::string& host, uint16_t port, Ticket ticket);

    // Closes idle connections on their loops and fails waiters. Later acquisitions fail.
    void Shutdown();

    bool secure() const { return tls_ != nullptr; }
    const Config& config() const { return cfg_; }

    size_t ActiveCount(const std::string& originKey) const;
    size_t IdleCount(const std::string& originKey) const;
    size_t WaiterCount(const std::string& originKey) const;
    // Origins with a leased, connecting, idle or queued connection.
    size_t OriginCount() const;

    static std::string OriginKey(const std::string& host, uint16_t port);

private:
    using ClientPtr = std::shared_ptr<webgate::network::TcpClient>;

    struct Waiter {
        Ticket ticket;
        webgate::network::EventLoop* loop;
        std::string host;
        uint16_t port;
        AcquireCallback cb;
    };

    struct OriginState {
        size_t active{0};
        std::unordered_map<webgate::network::EventLoop*, std::vector<ClientPtr>> idle;
        std::deque<Waiter> waiters;

        size_t IdleTotal() const;
    };

    struct PendingConnect {
        ClientPtr client;
        AcquireCallback cb;
    };

    void StartConnect(webgate::network::EventLoop* loop, const std::string& host, uint16_t port,
                      const std::string& key, AcquireCallback cb);
    void ConnectFailed(webgate::network::EventLoop* loop, const std::string& key, AcquireCallback cb,
                       const std::string& reason);
    void Release(webgate::network::EventLoop* loop, const std::string& key, ClientPtr client, bool keepAlive);
    void ReleaseInLoop(webgate::network::EventLoop* loop, const std::string& key, ClientPtr client, bool keepAlive);
    void DropIdle(webgate::network::EventLoop* loop, const std::string& key, webgate::network::TcpClient* client);
    void ServeWaiters(const std::string& key);
    // Caller holds mutex_. Dead connections found on the way are appended to dead.
    ClientPtr PopIdleLocked(OriginState* st, webgate::network::EventLoop* loop, std::vector<ClientPtr>* dead);
    // Caller holds mutex_. Drops empty idle lists, then the origin itself once nothing refers to it.
    void PruneLocked(const std::string& key);
    void InstallIdleHandlers(webgate::network::EventLoop* loop, const std::string& key, const ClientPtr& client);

    static void DestroyOnLoop(webgate::network::EventLoop* loop, std::vector<ClientPtr> clients);

    const Config cfg_;
    webgate::network::Resolver* resolver_;
    webgate::network::TlsContext* tls_;

    mutable std::mutex mutex_;
    std::map<std::string, OriginState> origins_;
    Ticket nextTicket_{0};
    bool shutdown_{false};
};

} // namespace upstream
} // namespace webgate
