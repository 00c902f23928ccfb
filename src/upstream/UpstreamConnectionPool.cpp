#include "webgate/upstream/UpstreamConnectionPool.h"
#include "webgate/network/Resolver.h"
#include "webgate/network/TlsContext.h"
#include "webgate/protocol/HeaderMap.h"
#include "webgate/common/Logger.h"

#include <utility>

namespace webgate {
namespace upstream {

using webgate::network::Buffer;
using webgate::network::EventLoop;
using webgate::network::InetAddress;
using webgate::network::TcpClient;
using webgate::network::TcpConnectionPtr;

namespace {

const size_t kDefaultHighWaterMark = 64 * 1024 * 1024;

} // namespace

UpstreamConnectionPool::Lease::Lease(EventLoop* loop,
                                     std::string originKey,
                                     std::shared_ptr<TcpClient> client,
                                     UpstreamConnectionPool* pool,
                                     bool reused)
    : loop_(loop), originKey_(std::move(originKey)), client_(std::move(client)), pool_(pool), reused_(reused) {
}

UpstreamConnectionPool::Lease::~Lease() {
    Release(false);
}

TcpConnectionPtr UpstreamConnectionPool::Lease::connection() const {
    if (!client_) return {};
    return client_->connection();
}

void UpstreamConnectionPool::Lease::Release(bool keepAlive) {
    if (released_) return;
    released_ = true;
    pool_->Release(loop_, originKey_, std::move(client_), keepAlive);
}

size_t UpstreamConnectionPool::OriginState::IdleTotal() const {
    size_t n = 0;
    for (const auto& kv : idle) n += kv.second.size();
    return n;
}

UpstreamConnectionPool::UpstreamConnectionPool(Config cfg,
                                               webgate::network::Resolver* resolver,
                                               webgate::network::TlsContext* tls)
    : cfg_(std::move(cfg)), resolver_(resolver), tls_(tls) {
}

UpstreamConnectionPool::~UpstreamConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : origins_) {
        if (kv.second.IdleTotal() > 0) {
            LOG_WARN << "UpstreamConnectionPool[" << cfg_.name << "] destroyed with idle connections to "
                     << kv.first << "; Shutdown() was not called";
        }
    }
}

std::string UpstreamConnectionPool::OriginKey(const std::string& host, uint16_t port) {
    const std::string h = webgate::protocol::HeaderMap::ToLower(host);
    if (h.find(':') != std::string::npos) return "[" + h + "]:" + std::to_string(port);
    return h + ":" + std::to_string(port);
}

void UpstreamConnectionPool::DestroyOnLoop(EventLoop* loop, std::vector<ClientPtr> clients) {
    if (clients.empty()) return;
    // TcpClient must die on its own loop, and never inside one of its callbacks.
    loop->QueueInLoop([clients]() mutable { clients.clear(); });
}

UpstreamConnectionPool::Ticket UpstreamConnectionPool::Acquire(EventLoop* loop, const std::string& host,
                                                               uint16_t port, AcquireCallback cb) {
    const std::string key = OriginKey(host, port);
    ClientPtr reused;
    std::vector<ClientPtr> dead;
    Ticket ticket = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticket = ++nextTicket_;
        if (shutdown_) {
            loop->QueueInLoop([cb]() { cb(nullptr, "connection pool is shut down"); });
            return ticket;
        }
        OriginState& st = origins_[key];
        if (st.active >= cfg_.maxSockets || !st.waiters.empty()) {
            st.waiters.push_back(Waiter{ticket, loop, host, port, std::move(cb)});
            LOG_DEBUG << "UpstreamConnectionPool[" << cfg_.name << "] " << key << " at cap ("
                      << st.active << "), queued, waiters=" << st.waiters.size();
            return ticket;
        }
        ++st.active;
        reused = PopIdleLocked(&st, loop, &dead);
        PruneLocked(key);
    }
    DestroyOnLoop(loop, std::move(dead));

    if (reused) {
        auto lease = std::make_shared<Lease>(loop, key, reused, this, true);
        loop->QueueInLoop([cb, lease]() { cb(lease, std::string()); });
        return ticket;
    }
    StartConnect(loop, host, port, key, std::move(cb));
    return ticket;
}

bool UpstreamConnectionPool::Cancel(const std::string& host, uint16_t port, Ticket ticket) {
    const std::string key = OriginKey(host, port);
    std::lock_guard<std::mutex> lock(mutex_);
    auto oit = origins_.find(key);
    if (oit == origins_.end()) return false;
    auto& waiters = oit->second.waiters;
    for (auto it = waiters.begin(); it != waiters.end(); ++it) {
        if (it->ticket == ticket) {
            waiters.erase(it);
            LOG_DEBUG << "UpstreamConnectionPool[" << cfg_.name << "] " << key << " waiter withdrawn, waiters="
                      << waiters.size();
            PruneLocked(key);
            return true;
        }
    }
    return false;
}

void UpstreamConnectionPool::PruneLocked(const std::string& key) {
    auto oit = origins_.find(key);
    if (oit == origins_.end()) return;
    OriginState& st = oit->second;
    for (auto it = st.idle.begin(); it != st.idle.end();) {
        if (it->second.empty()) {
            it = st.idle.erase(it);
        } else {
            ++it;
        }
    }
    if (st.active == 0 && st.idle.empty() && st.waiters.empty()) origins_.erase(oit);
}

UpstreamConnectionPool::ClientPtr UpstreamConnectionPool::PopIdleLocked(OriginState* st, EventLoop* loop,
                                                                       std::vector<ClientPtr>* dead) {
    auto it = st->idle.find(loop);
    if (it == st->idle.end()) return nullptr;
    auto& list = it->second;
    while (!list.empty()) {
        ClientPtr client = std::move(list.back());
        list.pop_back();
        TcpConnectionPtr conn = client->connection();
        if (conn && conn->connected()) return client;
        dead->push_back(std::move(client));
    }
    return nullptr;
}

void UpstreamConnectionPool::StartConnect(EventLoop* loop, const std::string& host, uint16_t port,
                                          const std::string& key, AcquireCallback cb) {
    resolver_->Resolve(loop, host, port,
                       [this, loop, host, key, cb](bool ok, const InetAddress& addr, const std::string& error) {
        if (!ok) {
            ConnectFailed(loop, key, cb, error);
            return;
        }

        auto client = std::make_shared<TcpClient>(loop, addr, cfg_.name + "-" + key, cfg_.connectTimeoutSec);
        if (tls_) client->EnableTls(tls_->ctx(), host, tls_->verifyPeer());

        // Settled exactly once by whichever callback fires first.
        auto pending = std::make_shared<PendingConnect>();
        pending->client = client;
        pending->cb = cb;

        client->SetConnectionCallback([this, loop, key, pending](const TcpConnectionPtr& conn) {
            if (!pending->client) return;
            ClientPtr c = std::move(pending->client);
            AcquireCallback done = std::move(pending->cb);
            if (conn->connected()) {
                LOG_DEBUG << "UpstreamConnectionPool[" << cfg_.name << "] new connection " << conn->name();
                auto lease = std::make_shared<Lease>(loop, key, c, this, false);
                loop->QueueInLoop([done, lease]() { done(lease, std::string()); });
            } else {
                const std::string reason = conn->tlsError().empty() ? "connection closed during setup"
                                                                    : "TLS failure: " + conn->tlsError();
                DestroyOnLoop(loop, {c});
                ConnectFailed(loop, key, done, reason);
            }
        });
        client->SetErrorCallback([this, loop, key, pending](const std::string& reason) {
            if (!pending->client) return;
            ClientPtr c = std::move(pending->client);
            AcquireCallback done = std::move(pending->cb);
            DestroyOnLoop(loop, {c});
            ConnectFailed(loop, key, done, reason);
        });
        LOG_DEBUG << "UpstreamConnectionPool[" << cfg_.name << "] connecting to " << key
                  << " at " << addr.toIpPort();
        client->Connect();
    });
}

void UpstreamConnectionPool::ConnectFailed(EventLoop* loop, const std::string& key, AcquireCallback cb,
                                           const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto oit = origins_.find(key);
        if (oit != origins_.end() && oit->second.active > 0) --oit->second.active;
        PruneLocked(key);
    }
    LOG_WARN << "UpstreamConnectionPool[" << cfg_.name << "] cannot connect to " << key << ": " << reason;
    loop->QueueInLoop([cb, reason]() { cb(nullptr, reason); });
    ServeWaiters(key);
}

void UpstreamConnectionPool::Release(EventLoop* loop, const std::string& key, ClientPtr client, bool keepAlive) {
    // Deferred: Release is typically called from inside the connection's own callbacks.
    loop->QueueInLoop([this, loop, key, client, keepAlive]() { ReleaseInLoop(loop, key, client, keepAlive); });
}

void UpstreamConnectionPool::ReleaseInLoop(EventLoop* loop, const std::string& key, ClientPtr client, bool keepAlive) {
    bool pooled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        OriginState& st = origins_[key];
        if (st.active > 0) --st.active;
        TcpConnectionPtr conn = client ? client->connection() : TcpConnectionPtr();
        if (keepAlive && !shutdown_ && conn && conn->connected() && conn->inputBuffer()->ReadableBytes() == 0 &&
            st.IdleTotal() < cfg_.maxIdlePerOrigin) {
            InstallIdleHandlers(loop, key, client);
            st.idle[loop].push_back(client);
            pooled = true;
        }
        PruneLocked(key);
    }
    LOG_DEBUG << "UpstreamConnectionPool[" << cfg_.name << "] " << key
              << (pooled ? " connection back to idle" : " connection closed on release");
    // Not pooled: client goes out of scope here, outside any of its callbacks.
    client.reset();
    ServeWaiters(key);
}

void UpstreamConnectionPool::InstallIdleHandlers(EventLoop* loop, const std::string& key, const ClientPtr& client) {
    TcpConnectionPtr conn = client->connection();
    TcpClient* raw = client.get();
    conn->SetMessageCallback([](const TcpConnectionPtr& c, Buffer* buf, std::chrono::system_clock::time_point) {
        LOG_DEBUG << "idle upstream " << c->name() << " sent " << buf->ReadableBytes() << " unexpected bytes";
        buf->RetrieveAll();
        c->ForceClose();
    });
    conn->SetConnectionCallback([this, loop, key, raw](const TcpConnectionPtr& c) {
        if (!c->connected()) DropIdle(loop, key, raw);
    });
    conn->SetWriteCompleteCallback(webgate::network::WriteCompleteCallback());
    conn->SetHighWaterMarkCallback(webgate::network::HighWaterMarkCallback(), kDefaultHighWaterMark);
    // A response may have been paused for client backpressure.
    if (!conn->isReading()) conn->StartRead();
}

void UpstreamConnectionPool::DropIdle(EventLoop* loop, const std::string& key, TcpClient* client) {
    std::vector<ClientPtr> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto oit = origins_.find(key);
        if (oit == origins_.end()) return;
        auto lit = oit->second.idle.find(loop);
        if (lit == oit->second.idle.end()) return;
        auto& list = lit->second;
        for (auto it = list.begin(); it != list.end(); ++it) {
            if (it->get() == client) {
                dead.push_back(std::move(*it));
                list.erase(it);
                break;
            }
        }
        PruneLocked(key);
    }
    if (!dead.empty()) {
        LOG_DEBUG << "UpstreamConnectionPool[" << cfg_.name << "] idle connection to " << key << " closed by peer";
    }
    DestroyOnLoop(loop, std::move(dead));
}

void UpstreamConnectionPool::ServeWaiters(const std::string& key) {
    struct Ready {
        Waiter waiter;
        ClientPtr client;
    };
    std::vector<Ready> ready;
    std::map<EventLoop*, std::vector<ClientPtr>> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto oit = origins_.find(key);
        if (oit == origins_.end()) return;
        OriginState& st = oit->second;
        while (!shutdown_ && st.active < cfg_.maxSockets && !st.waiters.empty()) {
            Waiter w = std::move(st.waiters.front());
            st.waiters.pop_front();
            ++st.active;
            ClientPtr client = PopIdleLocked(&st, w.loop, &dead[w.loop]);
            ready.push_back(Ready{std::move(w), std::move(client)});
        }
        PruneLocked(key);
    }
    for (auto& kv : dead) DestroyOnLoop(kv.first, std::move(kv.second));

    for (auto& r : ready) {
        EventLoop* loop = r.waiter.loop;
        AcquireCallback cb = std::move(r.waiter.cb);
        if (r.client) {
            auto lease = std::make_shared<Lease>(loop, key, std::move(r.client), this, true);
            loop->QueueInLoop([cb, lease]() { cb(lease, std::string()); });
        } else {
            const std::string host = r.waiter.host;
            const uint16_t port = r.waiter.port;
            loop->QueueInLoop([this, loop, host, port, key, cb]() { StartConnect(loop, host, port, key, cb); });
        }
    }
}

void UpstreamConnectionPool::Shutdown() {
    std::map<EventLoop*, std::vector<ClientPtr>> idle;
    std::vector<Waiter> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        shutdown_ = true;
        for (auto& kv : origins_) {
            for (auto& il : kv.second.idle) {
                auto& dst = idle[il.first];
                for (auto& c : il.second) dst.push_back(std::move(c));
            }
            kv.second.idle.clear();
            for (auto& w : kv.second.waiters) waiters.push_back(std::move(w));
            kv.second.waiters.clear();
        }
    }
    size_t closed = 0;
    for (auto& kv : idle) {
        closed += kv.second.size();
        DestroyOnLoop(kv.first, std::move(kv.second));
    }
    for (auto& w : waiters) {
        AcquireCallback cb = std::move(w.cb);
        w.loop->QueueInLoop([cb]() { cb(nullptr, "connection pool is shut down"); });
    }
    LOG_INFO << "UpstreamConnectionPool[" << cfg_.name << "] shut down, closed " << closed
             << " idle connection(s), failed " << waiters.size() << " waiter(s)";
}

size_t UpstreamConnectionPool::ActiveCount(const std::string& originKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(originKey);
    return it == origins_.end() ? 0 : it->second.active;
}

size_t UpstreamConnectionPool::IdleCount(const std::string& originKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(originKey);
    return it == origins_.end() ? 0 : it->second.IdleTotal();
}

size_t UpstreamConnectionPool::OriginCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return origins_.size();
}

size_t UpstreamConnectionPool::WaiterCount(const std::string& originKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(originKey);
    return it == origins_.end() ? 0 : it->second.waiters.size();
}

} // namespace upstream
} // namespace webgate
