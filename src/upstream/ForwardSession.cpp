#include "webgate/upstream/ForwardSession.h"
#include "webgate/common/Logger.h"
#include "webgate/network/EventLoop.h"
#include "webgate/protocol/Compression.h"
#include "webgate/rewrite/RewritePipeline.h"

#include <cstdio>
#include <utility>

namespace webgate {
namespace upstream {

using webgate::network::Buffer;
using webgate::network::TcpConnectionPtr;
using webgate::protocol::BodyFramer;
using webgate::protocol::Compression;
using webgate::protocol::HeaderMap;
using webgate::protocol::HttpRequest;
using webgate::protocol::HttpResponse;
using webgate::rewrite::HlsManifestStage;
using webgate::rewrite::RewriteContext;

namespace {

const char* const kHopByHop[] = {"Connection", "Keep-Alive", "Proxy-Connection"};

// Bound on the inflated size of a compressed manifest, relative to max_manifest_bytes.
const size_t kMaxInflateRatio = 32;

std::string ChunkOf(const std::string& payload) {
    char size[32];
    std::snprintf(size, sizeof size, "%zx\r\n", payload.size());
    std::string out(size);
    out += payload;
    out += "\r\n";
    return out;
}

void StripHopByHop(HeaderMap* headers) {
    for (const char* name : kHopByHop) headers->Remove(name);
}

} // namespace

ForwardSession::ForwardSession(const TcpConnectionPtr& client,
                               const HttpRequest& request,
                               BodyFramer::Mode bodyMode,
                               uint64_t bodyLength,
                               const ResolvedTarget& target,
                               UpstreamConnectionPool* pool,
                               const RequestForwarder* forwarder,
                               RequestForwarder::DoneCallback done)
    : loop_(client->getLoop()),
      client_(client),
      request_(request),
      target_(target),
      pool_(pool),
      forwarder_(forwarder),
      done_(std::move(done)) {
    requestFramer_.Reset(bodyMode, bodyLength);
    requestDone_ = requestFramer_.done();
    clientKeepAlive_ = request_.keepAlive();
}

ForwardSession::~ForwardSession() {
    if (lease_) lease_->Release(false);
}

void ForwardSession::Start() {
    timer_ = std::make_unique<webgate::network::Timer>(loop_);
    ArmTimer();

    std::weak_ptr<ForwardSession> weak(shared_from_this());
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

void ForwardSession::ArmTimer() {
    const double timeout = forwarder_->options().timeoutSec;
    if (!timer_ || finished() || timeout <= 0) return;
    std::weak_ptr<ForwardSession> weak(shared_from_this());
    timer_->Start(timeout, [weak, timeout]() {
        auto self = weak.lock();
        if (!self || self->finished()) return;
        LOG_WARN << "[proxy] no upstream progress for " << timeout << "s: " << self->target_.href;
        self->Fail(HttpResponse::k504GatewayTimeout, "Gateway timeout: " + self->target_.url.host);
    });
}

void ForwardSession::OnLease(UpstreamConnectionPool::LeasePtr lease, const std::string& error) {
    acquiring_ = false;
    if (finished()) {
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

    std::weak_ptr<ForwardSession> weak(shared_from_this());
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
    }, forwarder_->options().highWaterBytes);

    LOG_DEBUG << "[proxy] " << request_.method() << " " << target_.href << " via " << upstream_->name()
              << (lease_->reused() ? " (reused)" : "");
    upstream_->Send(RequestForwarder::BuildUpstreamHead(request_, target_.url, false));
    if (!pendingBody_.empty()) {
        upstream_->Send(pendingBody_);
        pendingBody_.clear();
    }
    ResumeClient();
    ArmTimer();
}

void ForwardSession::CancelAcquire() {
    if (!acquiring_) return;
    acquiring_ = false;
    pool_->Cancel(target_.url.host, target_.url.EffectivePort(), ticket_);
}

void ForwardSession::OnClientData(Buffer* buf) {
    if (requestDone_ || finished()) return;
    size_t consumed = 0;
    if (!requestFramer_.Feed(buf->Peek(), buf->ReadableBytes(), &consumed)) {
        LOG_WARN << "[proxy] malformed request body for " << target_.href;
        Fail(HttpResponse::k400BadRequest, "Bad request: malformed chunked body");
        return;
    }
    SendToUpstream(buf->Peek(), consumed);
    buf->Retrieve(consumed);
    requestDone_ = requestFramer_.done();
}

void ForwardSession::SendToUpstream(const char* data, size_t len) {
    if (len == 0) return;
    if (upstream_) {
        upstream_->Send(data, len);
        return;
    }
    pendingBody_.append(data, len);
    if (pendingBody_.size() >= forwarder_->options().highWaterBytes) PauseClient();
}

void ForwardSession::SendToClient(const std::string& data) {
    if (auto client = client_.lock()) client->Send(data);
}

void ForwardSession::PauseClient() {
    if (clientPaused_) return;
    auto client = client_.lock();
    if (!client || !client->connected()) return;
    client->StopRead();
    clientPaused_ = true;
}

void ForwardSession::ResumeClient() {
    if (!clientPaused_) return;
    clientPaused_ = false;
    auto client = client_.lock();
    if (client && client->connected()) client->StartRead();
}

void ForwardSession::OnUpstreamWriteComplete() {
    if (finished() || !pendingBody_.empty()) return;
    ResumeClient();
}

void ForwardSession::OnUpstreamHighWater() {
    if (finished()) return;
    PauseClient();
}

void ForwardSession::OnClientHighWater() {
    if (finished() || !upstream_ || upstreamPaused_) return;
    upstream_->StopRead();
    upstreamPaused_ = true;
    // The client is the slow side; the upstream timeout does not apply while paused.
    timer_->Cancel();
}

void ForwardSession::OnClientWriteComplete() {
    if (!upstreamPaused_) return;
    upstreamPaused_ = false;
    if (finished() || !upstream_) return;
    upstream_->StartRead();
    ArmTimer();
}

void ForwardSession::OnUpstreamMessage(Buffer* buf) {
    if (finished()) return;
    ArmTimer();

    if (state_ == kAwaitingHead) {
        while (true) {
            if (!response_.parseResponse(buf, request_.isHead())) {
                Fail(HttpResponse::k502BadGateway, "Bad gateway: malformed response from " + target_.url.host);
                return;
            }
            if (!response_.gotHead()) return;
            const int status = response_.statusCode();
            if (status == 101) {
                Fail(HttpResponse::k502BadGateway, "Bad gateway: unexpected protocol switch");
                return;
            }
            if (status >= 100 && status < 200) {
                // Interim answers (100 Continue, 103 Early Hints) are passed on as they are.
                SendToClient(response_.rawHead());
                response_.reset();
                continue;
            }
            break;
        }
        if (!OnResponseHead()) return;
    }

    if (state_ == kStreaming) {
        StreamBody(buf);
    } else if (state_ == kBuffering) {
        BufferBody(buf);
    }
}

bool ForwardSession::OnResponseHead() {
    const BodyFramer::Mode mode = response_.bodyMode();
    const uint64_t length = response_.bodyLength();
    responseFramer_.Reset(mode, length);

    const std::string* contentType = response_.headers().Find("Content-Type");
    const bool manifest = contentType && mode != BodyFramer::kNone &&
                          HlsManifestStage::IsManifestContentType(*contentType);
    const size_t limit = forwarder_->options().maxManifestBytes;
    if (manifest && mode == BodyFramer::kLength && length > limit) {
        LOG_INFO << "[proxy] manifest of " << length << " bytes exceeds " << limit
                 << ", streaming unchanged: " << target_.href;
    } else if (manifest) {
        state_ = kBuffering;
        if (responseFramer_.done()) {
            FinishManifest();
            return false;
        }
        return true;
    }

    state_ = kStreaming;
    if (mode == BodyFramer::kChunked && request_.getVersion() == HttpRequest::kHttp10) dechunk_ = true;
    SendStreamHead(false);
    if (responseFramer_.done()) {
        Complete();
        return false;
    }
    return true;
}

void ForwardSession::SendStreamHead(bool rechunk) {
    RewriteContext ctx;
    ctx.status = response_.statusCode();
    ctx.reason = response_.reason();
    ctx.headers = response_.headers();
    ctx.bodyBuffered = false;
    ctx.requestUrl = target_.href;
    ctx = forwarder_->pipeline()->Run(std::move(ctx));

    StripHopByHop(&ctx.headers);
    if (rechunk) {
        ctx.headers.Remove("Content-Length");
        ctx.headers.Set("Transfer-Encoding", "chunked");
    }
    if (dechunk_) ctx.headers.Remove("Transfer-Encoding");
    if (responseFramer_.mode() == BodyFramer::kUntilClose || dechunk_) clientKeepAlive_ = false;
    ctx.headers.Set("Connection", clientKeepAlive_ ? "keep-alive" : "close");

    Buffer out;
    HttpResponse::AppendHead(&out, ctx.status, ctx.reason, ctx.headers);
    if (auto client = client_.lock()) client->Send(&out);
    responseStarted_ = true;
}

void ForwardSession::StreamBody(Buffer* buf) {
    if (buf->ReadableBytes() == 0 || responseFramer_.done()) return;
    const bool decode = rechunk_ || dechunk_;
    size_t consumed = 0;
    std::string payload;
    if (!responseFramer_.Feed(buf->Peek(), buf->ReadableBytes(), &consumed, decode ? &payload : nullptr)) {
        LOG_WARN << "[proxy] malformed chunked body from " << target_.href;
        Fail(HttpResponse::k502BadGateway, "Bad gateway: malformed response body");
        return;
    }
    if (decode) {
        if (!payload.empty()) SendToClient(rechunk_ ? ChunkOf(payload) : payload);
    } else if (consumed > 0) {
        if (auto client = client_.lock()) client->Send(buf->Peek(), consumed);
    }
    buf->Retrieve(consumed);

    if (responseFramer_.done()) {
        if (rechunk_) SendToClient("0\r\n\r\n");
        Complete();
    }
}

void ForwardSession::BufferBody(Buffer* buf) {
    size_t consumed = 0;
    if (!responseFramer_.Feed(buf->Peek(), buf->ReadableBytes(), &consumed, &manifestBody_)) {
        LOG_WARN << "[proxy] malformed chunked manifest from " << target_.href;
        Fail(HttpResponse::k502BadGateway, "Bad gateway: malformed response body");
        return;
    }
    buf->Retrieve(consumed);
    if (responseFramer_.done()) {
        FinishManifest();
    } else if (manifestBody_.size() > forwarder_->options().maxManifestBytes) {
        FallBackToStreaming();
    }
}

void ForwardSession::FallBackToStreaming() {
    LOG_INFO << "[proxy] manifest exceeds " << forwarder_->options().maxManifestBytes
             << " bytes, streaming unchanged: " << target_.href;
    state_ = kStreaming;
    std::string body;
    body.swap(manifestBody_);
    if (responseFramer_.mode() == BodyFramer::kChunked) {
        if (request_.getVersion() == HttpRequest::kHttp10) {
            dechunk_ = true;
        } else {
            rechunk_ = true;
        }
    }
    SendStreamHead(rechunk_);
    if (!body.empty()) SendToClient(rechunk_ ? ChunkOf(body) : body);
}

void ForwardSession::FinishManifest() {
    RewriteContext ctx;
    ctx.status = response_.statusCode();
    ctx.reason = response_.reason();
    ctx.headers = response_.headers();
    ctx.body.swap(manifestBody_);
    ctx.bodyBuffered = true;
    ctx.requestUrl = target_.href;

    const std::string encoding = ctx.headers.Get("Content-Encoding");
    if (!encoding.empty()) {
        const Compression::Encoding enc = Compression::ParseContentEncoding(encoding);
        if (enc == Compression::Encoding::kGzip || enc == Compression::Encoding::kDeflate) {
            std::string plain;
            const size_t maxOutput = forwarder_->options().maxManifestBytes * kMaxInflateRatio;
            if (Compression::Decompress(enc, ctx.body, &plain, maxOutput)) {
                ctx.body.swap(plain);
                ctx.headers.Remove("Content-Encoding");
            } else {
                LOG_WARN << "[proxy] cannot decode " << encoding << " manifest from " << target_.href
                         << ", passing it through";
                ctx.bodyBuffered = false;
            }
        } else if (enc != Compression::Encoding::kIdentity) {
            LOG_WARN << "[proxy] unsupported manifest encoding " << encoding << " from " << target_.href;
            ctx.bodyBuffered = false;
        }
    }

    ctx = forwarder_->pipeline()->Run(std::move(ctx));

    StripHopByHop(&ctx.headers);
    ctx.headers.Remove("Transfer-Encoding");
    std::string lengthKey = ctx.headers.FindKey("Content-Length");
    if (lengthKey.empty()) lengthKey = "Content-Length";
    ctx.headers.Set(lengthKey, std::to_string(ctx.body.size()));
    ctx.headers.Set("Connection", clientKeepAlive_ ? "keep-alive" : "close");

    Buffer out;
    HttpResponse::AppendHead(&out, ctx.status, ctx.reason, ctx.headers);
    out.Append(ctx.body);
    if (auto client = client_.lock()) client->Send(&out);
    responseStarted_ = true;
    Complete();
}

void ForwardSession::OnUpstreamClosed() {
    if (finished()) return;
    if (responseFramer_.mode() == BodyFramer::kUntilClose && (state_ == kStreaming || state_ == kBuffering)) {
        // The body ends with the connection.
        if (state_ == kBuffering) {
            FinishManifest();
        } else {
            if (rechunk_) SendToClient("0\r\n\r\n");
            Complete();
        }
        return;
    }
    std::string reason = "upstream closed the connection";
    if (upstream_ && !upstream_->tlsError().empty()) reason = "TLS failure: " + upstream_->tlsError();
    LOG_WARN << "[proxy] " << reason << " during " << target_.href;
    Fail(HttpResponse::k502BadGateway, "Bad gateway: " + reason);
}

void ForwardSession::Complete() {
    if (finished()) return;
    state_ = kDone;
    timer_->Cancel();
    // An unread request body leaves the client stream unparseable.
    if (!requestDone_) clientKeepAlive_ = false;

    if (lease_) {
        const bool reusable = response_.keepAlive() && responseFramer_.done() && requestDone_ &&
                              upstream_ && upstream_->connected() &&
                              upstream_->inputBuffer()->ReadableBytes() == 0;
        lease_->Release(reusable);
        lease_.reset();
    }
    upstream_.reset();
    ResumeClient();

    if (done_) {
        RequestForwarder::DoneCallback done = std::move(done_);
        done_ = nullptr;
        const bool keepAlive = clientKeepAlive_;
        auto self = shared_from_this();
        loop_->QueueInLoop([self, done, keepAlive]() { done(keepAlive); });
    }
}

void ForwardSession::Fail(HttpResponse::HttpStatusCode code, const std::string& message) {
    if (finished()) return;
    state_ = kFailed;
    if (timer_) timer_->Cancel();
    CancelAcquire();
    if (lease_) {
        lease_->Release(false);
        lease_.reset();
    }
    upstream_.reset();
    clientKeepAlive_ = false;

    LOG_WARN << "[proxy] " << static_cast<int>(code) << " for " << target_.href << ": " << message;
    auto client = client_.lock();
    if (client) {
        if (!responseStarted_) {
            HttpResponse resp = HttpResponse::MakeError(code, message, true);
            resp.setHeadOnly(request_.isHead());
            Buffer out;
            resp.appendToBuffer(&out);
            client->Send(&out);
            responseStarted_ = true;
        } else {
            // Part of the response is already out; truncation is the only signal left.
            client->ForceClose();
        }
    }
    ResumeClient();

    if (done_) {
        RequestForwarder::DoneCallback done = std::move(done_);
        done_ = nullptr;
        auto self = shared_from_this();
        loop_->QueueInLoop([self, done]() { done(false); });
    }
}

void ForwardSession::Abort() {
    if (finished()) return;
    state_ = kFailed;
    if (timer_) timer_->Cancel();
    CancelAcquire();
    if (lease_) {
        lease_->Release(false);
        lease_.reset();
    }
    upstream_.reset();
    done_ = nullptr;
    LOG_DEBUG << "[proxy] client left before " << target_.href << " finished";
}

} // namespace upstream
} // namespace webgate
