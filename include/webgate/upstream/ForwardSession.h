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

// One request/response exchange between a client connection and an origin.
// Lives on the client's loop; the upstream connection is leased from a pool on the same loop.
// The response is streamed back as it arrives, except HLS manifests, which are collected,
// rewritten and sent with a fresh Content-Length.
class ForwardSession : public std::enable_shared_from_this<ForwardSession>,
                       webgate::common::noncopyable {
public:
    ForwardSession(const webgate::network::TcpConnectionPtr& client,
                   const webgate::protocol::HttpRequest& request,
                   webgate::protocol::BodyFramer::Mode bodyMode,
                   uint64_t bodyLength,
                   const ResolvedTarget& target,
                   UpstreamConnectionPool* pool,
                   const RequestForwarder* forwarder,
                   RequestForwarder::DoneCallback done);
    ~ForwardSession();

    void Start();

    // Takes request body bytes from the client input buffer. Anything after the body
    // (a pipelined request) is left in buf.
    void OnClientData(webgate::network::Buffer* buf);
    void OnClientWriteComplete();
    void OnClientHighWater();
    // Client went away. Releases the upstream connection without keep-alive.
    void Abort();

    bool requestBodyDone() const { return requestDone_; }
    bool finished() const { return state_ == kDone || state_ == kFailed; }

private:
    enum State {
        kAcquiring,
        kAwaitingHead,
        kStreaming,
        kBuffering,
        kDone,
        kFailed,
    };

    void OnLease(UpstreamConnectionPool::LeasePtr lease, const std::string& error);
    void OnUpstreamMessage(webgate::network::Buffer* buf);
    void OnUpstreamClosed();
    void OnUpstreamWriteComplete();
    void OnUpstreamHighWater();

    // false when the session ended while handling the head
    bool OnResponseHead();
    void SendStreamHead(bool rechunk);
    void StreamBody(webgate::network::Buffer* buf);
    void BufferBody(webgate::network::Buffer* buf);
    void FallBackToStreaming();
    void FinishManifest();

    void SendToUpstream(const char* data, size_t len);
    void SendToClient(const std::string& data);
    void ArmTimer();
    void Complete();
    void Fail(webgate::protocol::HttpResponse::HttpStatusCode code, const std::string& message);
    void PauseClient();
    void ResumeClient();
    // Withdraws a pool acquisition that has not been served yet.
    void CancelAcquire();

    webgate::network::EventLoop* loop_;
    std::weak_ptr<webgate::network::TcpConnection> client_;
    webgate::protocol::HttpRequest request_;
    ResolvedTarget target_;
    UpstreamConnectionPool* pool_;
    const RequestForwarder* forwarder_;
    RequestForwarder::DoneCallback done_;

    State state_{kAcquiring};
    UpstreamConnectionPool::Ticket ticket_{0};
    bool acquiring_{false};
    UpstreamConnectionPool::LeasePtr lease_;
    webgate::network::TcpConnectionPtr upstream_;
    std::unique_ptr<webgate::network::Timer> timer_;

    webgate::protocol::BodyFramer requestFramer_;
    bool requestDone_{false};
    // Request body received before the upstream connection was ready.
    std::string pendingBody_;
    bool clientPaused_{false};

    webgate::protocol::HttpResponseContext response_;
    webgate::protocol::BodyFramer responseFramer_;
    bool responseStarted_{false};
    bool clientKeepAlive_{false};
    bool upstreamPaused_{false};
    // Upstream body is dechunked and sent again as chunks (manifest fallback).
    bool rechunk_{false};
    // Upstream chunked body to an HTTP/1.0 client: payload only, ended by close.
    bool dechunk_{false};
    std::string manifestBody_;
};

using ForwardSessionPtr = std::shared_ptr<ForwardSession>;

} // namespace upstream
} // namespace webgate
