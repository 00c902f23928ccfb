#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/Buffer.h"
#include "webgate/network/TcpConnection.h"
#include "webgate/network/Timer.h"
#include "webgate/protocol/BodyFramer.h"
#include "webgate/protocol/HttpRequest.h"
#include "webgate/protocol/HttpResponse.h"
#include "webgate/protocol/HttpResponseContext.h"
#include "webgate/upstream/RequestForwarder.h"
#include "webgate/upstream/UpstreamConnectionPool.h"

#include <memory>
#include <string>

namespace webgate {
namespace upstream {

// Forwards an upgrade handshake and, once the origin answers 101, splices the two
// connections byte for byte. The upstream connection is never pooled again.
class UpgradeTunnel : public std::enable_shared_from_this<UpgradeTunnel>,
                      webgate::common::noncopyable {
public:
    UpgradeTunnel(const webgate::network::TcpConnectionPtr& client,
                  const webgate::protocol::HttpRequest& request,
                  const ResolvedTarget& target,
                  UpstreamConnectionPool* pool,
                  const ForwardOptions& options);
    ~UpgradeTunnel();

    void Start();

    // Everything the client sends after its handshake belongs to the tunnel.
    void OnClientData(webgate::network::Buffer* buf);
    void OnClientWriteComplete();
    void OnClientHighWater();
    // Client closed: the upstream side goes down too.
    void Abort();

    bool spliced() const { return state_ == kSpliced; }
    bool closed() const { return state_ == kClosed; }

private:
    enum State {
        kAcquiring,
        kAwaitingHead,
        kSpliced,
        kRefused,   // non-101 answer being relayed
        kClosed,
    };

    void OnLease(UpstreamConnectionPool::LeasePtr lease, const std::string& error);
    void OnUpstreamMessage(webgate::network::Buffer* buf);
    void OnUpstreamClosed();
    void OnUpstreamWriteComplete();
    void OnUpstreamHighWater();

    void RelayRefusal(webgate::network::Buffer* buf);
    // Ends the tunnel; the client keeps whatever is still queued for it.
    void CloseBoth();
    void Fail(webgate::protocol::HttpResponse::HttpStatusCode code, const std::string& message);
    void ReleaseUpstream();

    webgate::network::EventLoop* loop_;
    std::weak_ptr<webgate::network::TcpConnection> client_;
    webgate::protocol::HttpRequest request_;
    ResolvedTarget target_;
    UpstreamConnectionPool* pool_;
    const ForwardOptions options_;

    State state_{kAcquiring};
    UpstreamConnectionPool::Ticket ticket_{0};
    // Acquire issued, lease callback not yet run.
    bool acquiring_{false};
    UpstreamConnectionPool::LeasePtr lease_;
    webgate::network::TcpConnectionPtr upstream_;
    std::unique_ptr<webgate::network::Timer> timer_;

    // Client bytes received before the upstream connection was ready.
    std::string pending_;
    webgate::protocol::HttpResponseContext response_;
    webgate::protocol::BodyFramer refusalFramer_;
    bool responseStarted_{false};
    bool clientPaused_{false};
    bool upstreamPaused_{false};
};

using UpgradeTunnelPtr = std::shared_ptr<UpgradeTunnel>;

} // namespace upstream
} // namespace webgate
