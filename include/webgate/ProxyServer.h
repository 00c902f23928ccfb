#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/InetAddress.h"
#include "webgate/network/Resolver.h"
#include "webgate/network/TcpServer.h"
#include "webgate/network/Timer.h"
#include "webgate/network/TlsContext.h"
#include "webgate/protocol/HttpRequest.h"
#include "webgate/protocol/HttpResponse.h"
#include "webgate/rewrite/RewritePipeline.h"
#include "webgate/upstream/RequestForwarder.h"
#include "webgate/upstream/TargetResolver.h"
#include "webgate/upstream/UpstreamConnectionPool.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace webgate {

namespace common {
class Config;
} // namespace common

struct ProxySessionContext;

struct ProxyOptions {
    uint16_t port{8080};
    bool loopbackOnly{false};
    int threads{4};

    std::string prefix{"/proxy/"};
    bool logRequests{true};
    size_t maxManifestBytes{8 * 1024 * 1024};
    size_t tunnelHighWaterBytes{8 * 1024 * 1024};

    size_t maxSockets{50};
    size_t maxIdlePerOrigin{8};
    // Off by default: upstream certificates are accepted as presented.
    bool tlsVerify{false};
    std::string caFile;
    double timeoutSec{120.0};
    // Concurrent DNS lookups; a slow name server holds one worker per lookup.
    int resolverThreads{8};
    // "host:port=ip:port" pins consulted before DNS.
    std::vector<std::string> resolve;

    bool tlsEnable{false};
    std::string certPath;
    std::string keyPath;

    // [global], [proxy], [upstream] and [tls] settings, then the PORT and
    // SILENT_PROXY_LOGS environment overrides.
    static ProxyOptions FromConfig(common::Config& conf);
};

// Forward proxy for "<prefix><absolute url>" requests, plus the UI page on "/".
class ProxyServer : webgate::common::noncopyable {
public:
    ProxyServer(network::EventLoop* loop, const ProxyOptions& options, const std::string& name = "webgate");
    ~ProxyServer();

    // Listens and starts the I/O threads. Base loop thread only.
    bool Start();
    // Stops accepting, drops in-flight exchanges, closes pooled connections and quits the
    // base loop once every client connection is gone.
    void Stop();

    bool AddResolveOverride(const std::string& spec);

    network::InetAddress listenAddress() const { return server_->listenAddress(); }
    const network::Resolver& resolver() const { return *resolver_; }
    upstream::UpstreamConnectionPool* plainPool() { return plainPool_.get(); }
    upstream::UpstreamConnectionPool* tlsPool() { return tlsPool_.get(); }
    const rewrite::RewritePipeline& pipeline() const { return *pipeline_; }
    const ProxyOptions& options() const { return options_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void OnWriteComplete(const network::TcpConnectionPtr& conn);
    void OnHighWater(const network::TcpConnectionPtr& conn, size_t bytes);

    // Parses and dispatches requests until one is in flight or the buffer runs dry.
    void ProcessRequests(const network::TcpConnectionPtr& conn,
                         const std::shared_ptr<ProxySessionContext>& ctx,
                         network::Buffer* buf);
    void HandleRequest(const network::TcpConnectionPtr& conn,
                       const std::shared_ptr<ProxySessionContext>& ctx,
                       const protocol::HttpRequest& request,
                       protocol::BodyFramer::Mode bodyMode,
                       uint64_t bodyLength,
                       network::Buffer* buf);
    void SendLocal(const network::TcpConnectionPtr& conn,
                   const std::shared_ptr<ProxySessionContext>& ctx,
                   protocol::HttpResponse& response);
    void OnExchangeDone(const std::weak_ptr<network::TcpConnection>& weakConn, bool keepAlive);
    void CheckDrained(std::chrono::steady_clock::time_point deadline);

    static std::shared_ptr<ProxySessionContext> GetContext(const network::TcpConnectionPtr& conn);

    network::EventLoop* loop_;
    const ProxyOptions options_;

    std::unique_ptr<network::TlsContext> upstreamTls_;
    std::unique_ptr<network::Resolver> resolver_;
    std::unique_ptr<upstream::UpstreamConnectionPool> plainPool_;
    std::unique_ptr<upstream::UpstreamConnectionPool> tlsPool_;
    std::unique_ptr<rewrite::RewritePipeline> pipeline_;
    std::unique_ptr<upstream::RequestForwarder> forwarder_;
    upstream::TargetResolver targetResolver_;
    std::unique_ptr<network::Timer> drainTimer_;
    std::atomic_bool stopping_{false};

    // Last member: destroyed first, so its I/O threads are gone before the pools.
    std::unique_ptr<network::TcpServer> server_;
};

} // namespace webgate
