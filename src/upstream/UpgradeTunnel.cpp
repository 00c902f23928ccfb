#include "webgate/upstream/UpgradeTunnel.h"
#include "webgate/common/Logger.h"
#include "webgate/network/EventLoop.h"

#include <utility>

namespace webgate {
namespace upstream {

using webgate::network::Buffer;
using webgate::network::TcpConnectionPtr;
using webgate::protocol::BodyFramer;
using webgate::protocol::HttpResponse;

namespace {

// Closes after queued output is flushed, or right away when nothing is queued.
void CloseAfterFlush(const TcpConnectionPtr& conn) {
    if (!conn || conn->disconnected()) return;
    if (conn->outputBytes() > 0) {
        conn->Shutdown();
    } else {
        conn->ForceClose();
    }
}

} // namespace

UpgradeTunnel::UpgradeTunnel(const TcpConnectionPtr& client,
                             const webgate::protocol::HttpRequest& request,
                             const ResolvedTarget& target,
                             UpstreamConnectionPool* pool,
                             const ForwardOptions& options)
    : loop_(client->getLoop()),
      client_(client),
      request_(request),
      target_(target),
      pool_(pool),
      options_(options) {
}

UpgradeTunnel::~UpgradeTunnel() {
    if (lease_) lease_->Release(false);
}

void UpgradeTunnel::Start() {
    timer_ = std::make_unique<webgate::network::Timer>(loop_);
    std::weak_ptr<UpgradeTunnel> weak(shared_from_this());
    if (options_.timeoutSec > 0) {
        // Covers connect and handshake only; a spliced tunnel may stay quiet forever.
        timer_->Start(options_.timeoutSec, [weak]() {
            auto self = weak.lock();
            if (!self || self->state_ == kSpliced || self->state_ == kClosed) return;
            LOG_WARN << "[tunnel] upgrade handshake timed out: " << self->target_.href;
            self->Fail(HttpResponse::k504GatewayTimeout, "Gateway timeout: " + self->target_.url.host);
        });
    }
    acquiring_ = true;
    ticket_ = pool_->Acquire(loop_, target_.url.host, target_.url.EffectivePort(),
                             [weak](UpstreamConnectionPool::LeasePtr lease, const std::string& error) {
        auto self = weak.lock();
        if (!self) {
            if (lease) lease->Release(false);
            return;
        }
        self->OnLease(std::move(lease), error);
    });
}

void UpgradeTunnel::OnLease(UpstreamConnectionPool::LeasePtr lease, const std::string& error) {
    acquiring_ = false;
    if (state_ == kClosed) {
        if (lease) lease->Release(false);
        return;
    }
    if (!lease) {
        Fail(HttpResponse::k502BadGateway, "Bad gateway: " + error);
        return;
    }
    upstream_ = lease->connection();
    lease_ = std::move(lease);
    if (!upstream_ || !upstream_->connected()) {
        Fail(HttpResponse::k502BadGateway, "Bad gateway: upstream connection lost");
        return;
    }
    state_ = kAwaitingHead;

    std::weak_ptr<UpgradeTunnel> weak(shared_from_this());
    upstream_->SetMessageCallback([weak](const TcpConnectionPtr&, Buffer* buf, std::chrono::system_clock::time_point) {
        if (auto self = weak.lock()) self->OnUpstreamMessage(buf);
    });
    upstream_->SetConnectionCallback([weak](const TcpConnectionPtr& conn) {
        if (conn->connected()) return;
        if (auto self = weak.lock()) self->OnUpstreamClosed();
    });
    upstream_->SetWriteCompleteCallback([weak](const TcpConnectionPtr&) {
        if (auto self = weak.lock()) self->OnUpstreamWriteComplete();
    });
    upstream_->SetHighWaterMarkCallback([weak](const TcpConnectionPtr&, size_t) {
        if (auto self = weak.lock()) self->OnUpstreamHighWater();
    }, options_.highWaterBytes);

    LOG_DEBUG << "[tunnel] handshake to " << target_.href << " via " << upstream_->name();
    upstream_->Send(RequestForwarder::BuildUpstreamHead(request_, target_.url, true));
    if (!pending_.empty()) {
        upstream_->Send(pending_);
        pending_.clear();
    }
    if (clientPaused_) {
        clientPaused_ = false;
        auto client = client_.lock();
        if (client && client->connected()) client->StartRead();
    }
}

void UpgradeTunnel::OnClientData(Buffer* buf) {
    if (state_ == kClosed || state_ == kRefused) {
        buf->RetrieveAll();
        return;
    }
    if (upstream_) {
        upstream_->Send(buf);
        return;
    }
    pending_.append(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();
    if (pending_.size() >= options_.highWaterBytes && !clientPaused_) {
        if (auto client = client_.lock()) client->StopRead();
        clientPaused_ = true;
    }
}

void UpgradeTunnel::OnUpstreamMessage(Buffer* buf) {
    if (state_ == kClosed) return;
    auto client = client_.lock();
    if (!client) return;

    if (state_ == kAwaitingHead) {
        if (!response_.parseResponse(buf, false)) {
            Fail(HttpResponse::k502BadGateway, "Bad gateway: malformed handshake response");
            return;
        }
        if (!response_.gotHead()) return;
        responseStarted_ = true;
        client->Send(response_.rawHead());
        if (response_.statusCode() != 101) {
            LOG_INFO << "[tunnel] upgrade refused with " << response_.statusCode() << ": " << target_.href;
            state_ = kRefused;
            refusalFramer_.Reset(response_.bodyMode(), response_.bodyLength());
            timer_->Cancel();
            RelayRefusal(buf);
            return;
        }
        state_ = kSpliced;
        timer_->Cancel();
        LOG_DEBUG << "[tunnel] spliced " << client->name() << " <-> " << upstream_->name();
    }

    if (state_ == kSpliced) {
        client->Send(buf);
    } else if (state_ == kRefused) {
        RelayRefusal(buf);
    }
}

void UpgradeTunnel::RelayRefusal(Buffer* buf) {
    size_t consumed = 0;
    if (!refusalFramer_.Feed(buf->Peek(), buf->ReadableBytes(), &consumed)) {
        CloseBoth();
        return;
    }
    if (consumed > 0) {
        if (auto client = client_.lock()) client->Send(buf->Peek(), consumed);
    }
    buf->Retrieve(consumed);
    if (refusalFramer_.done()) CloseBoth();
}

void UpgradeTunnel::OnUpstreamClosed() {
    if (state_ == kClosed) return;
    if (state_ == kAwaitingHead || state_ == kAcquiring) {
        std::string reason = "upstream closed during handshake";
        if (upstream_ && !upstream_->tlsError().empty()) reason = "TLS failure: " + upstream_->tlsError();
        Fail(HttpResponse::k502BadGateway, "Bad gateway: " + reason);
        return;
    }
    LOG_DEBUG << "[tunnel] upstream closed: " << target_.href;
    CloseBoth();
}

void UpgradeTunnel::OnClientHighWater() {
    if (!upstream_ || upstreamPaused_ || state_ == kClosed) return;
    upstream_->StopRead();
    upstreamPaused_ = true;
}

void UpgradeTunnel::OnClientWriteComplete() {
    if (!upstreamPaused_) return;
    upstreamPaused_ = false;
    if (upstream_ && state_ != kClosed) upstream_->StartRead();
}

void UpgradeTunnel::OnUpstreamHighWater() {
    if (clientPaused_ || state_ == kClosed) return;
    auto client = client_.lock();
    if (!client || !client->connected()) return;
    client->StopRead();
    clientPaused_ = true;
}

void UpgradeTunnel::OnUpstreamWriteComplete() {
    if (!clientPaused_ || state_ == kClosed || !pending_.empty()) return;
    clientPaused_ = false;
    auto client = client_.lock();
    if (client && client->connected()) client->StartRead();
}

void UpgradeTunnel::ReleaseUpstream() {
    if (timer_) timer_->Cancel();
    if (acquiring_) {
        // Still queued behind the origin's cap: give the place up.
        acquiring_ = false;
        pool_->Cancel(target_.url.host, target_.url.EffectivePort(), ticket_);
    }
    if (lease_) {
        lease_->Release(false);
        lease_.reset();
    }
}

void UpgradeTunnel::CloseBoth() {
    if (state_ == kClosed) return;
    state_ = kClosed;
    upstream_.reset();
    ReleaseUpstream();
    CloseAfterFlush(client_.lock());
}

void UpgradeTunnel::Fail(HttpResponse::HttpStatusCode code, const std::string& message) {
    if (state_ == kClosed) return;
    state_ = kClosed;
    upstream_.reset();
    ReleaseUpstream();
    LOG_WARN << "[tunnel] " << static_cast<int>(code) << " for " << target_.href << ": " << message;
    auto client = client_.lock();
    if (!client) return;
    if (responseStarted_) {
        client->ForceClose();
        return;
    }
    Buffer out;
    HttpResponse::MakeError(code, message, true).appendToBuffer(&out);
    client->Send(&out);
    client->Shutdown();
}

void UpgradeTunnel::Abort() {
    if (state_ == kClosed) return;
    state_ = kClosed;
    LOG_DEBUG << "[tunnel] client closed: " << target_.href;
    upstream_.reset();
    ReleaseUpstream();
}

} // namespace upstream
} // namespace webgate
