#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/Callbacks.h"
#include "webgate/protocol/BodyFramer.h"
#include "webgate/protocol/HttpRequest.h"
#include "webgate/upstream/TargetResolver.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace webgate {

namespace rewrite {
class RewritePipeline;
} // namespace rewrite

namespace upstream {

class ForwardSession;
class UpgradeTunnel;
class UpstreamConnectionPool;

struct ForwardOptions {
    // Connect, response head and inter-byte timeout.
    double timeoutSec{120.0};
    // Larger manifests are streamed without rewriting.
    size_t maxManifestBytes{8 * 1024 * 1024};
    // Output-buffer size at which the opposite side stops being read.
    size_t highWaterBytes{8 * 1024 * 1024};
};

// Starts upstream exchanges for parsed client requests. Owns nothing but configuration:
// pools and pipeline are injected and outlive it.
class RequestForwarder : webgate::common::noncopyable {
public:
    // Called on the client loop when the exchange is over. keepAlive: the client connection
    // may carry the next request.
    using DoneCallback = std::function<void(bool keepAlive)>;

    RequestForwarder(UpstreamConnectionPool* plainPool,
                     UpstreamConnectionPool* tlsPool,
                     const webgate::rewrite::RewritePipeline* pipeline,
                     ForwardOptions options);

    UpstreamConnectionPool* PoolFor(const webgate::protocol::Url& url) const;
    const webgate::rewrite::RewritePipeline* pipeline() const { return pipeline_; }
    const ForwardOptions& options() const { return options_; }

    // The returned session is already started. Feed it the request body with OnClientData().
    std::shared_ptr<ForwardSession> Forward(const webgate::network::TcpConnectionPtr& client,
                                            const webgate::protocol::HttpRequest& request,
                                            webgate::protocol::BodyFramer::Mode bodyMode,
                                            uint64_t bodyLength,
                                            const ResolvedTarget& target,
                                            DoneCallback done) const;

    std::shared_ptr<UpgradeTunnel> Upgrade(const webgate::network::TcpConnectionPtr& client,
                                           const webgate::protocol::HttpRequest& request,
                                           const ResolvedTarget& target) const;

    // Request line and headers for the origin. Host is replaced by the target authority and
    // proxy hop-by-hop fields are dropped. Ordinary requests ask for keep-alive; upgrades keep
    // their Connection/Upgrade fields.
    static std::string BuildUpstreamHead(const webgate::protocol::HttpRequest& request,
                                         const webgate::protocol::Url& target,
                                         bool upgrade);

private:
    UpstreamConnectionPool* plainPool_;
    UpstreamConnectionPool* tlsPool_;
    const webgate::rewrite::RewritePipeline* pipeline_;
    const ForwardOptions options_;
};

} // namespace upstream
} // namespace webgate
