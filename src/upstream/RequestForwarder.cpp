#include "webgate/upstream/RequestForwarder.h"
#include "webgate/upstream/ForwardSession.h"
#include "webgate/upstream/UpgradeTunnel.h"
#include "webgate/upstream/UpstreamConnectionPool.h"

namespace webgate {
namespace upstream {

using webgate::protocol::HeaderMap;

RequestForwarder::RequestForwarder(UpstreamConnectionPool* plainPool,
                                   UpstreamConnectionPool* tlsPool,
                                   const webgate::rewrite::RewritePipeline* pipeline,
                                   ForwardOptions options)
    : plainPool_(plainPool), tlsPool_(tlsPool), pipeline_(pipeline), options_(options) {
}

UpstreamConnectionPool* RequestForwarder::PoolFor(const webgate::protocol::Url& url) const {
    return url.IsSecure() ? tlsPool_ : plainPool_;
}

std::shared_ptr<ForwardSession> RequestForwarder::Forward(const webgate::network::TcpConnectionPtr& client,
                                                          const webgate::protocol::HttpRequest& request,
                                                          webgate::protocol::BodyFramer::Mode bodyMode,
                                                          uint64_t bodyLength,
                                                          const ResolvedTarget& target,
                                                          DoneCallback done) const {
    auto session = std::make_shared<ForwardSession>(client, request, bodyMode, bodyLength, target,
                                                    PoolFor(target.url), this, std::move(done));
    session->Start();
    return session;
}

std::shared_ptr<UpgradeTunnel> RequestForwarder::Upgrade(const webgate::network::TcpConnectionPtr& client,
                                                         const webgate::protocol::HttpRequest& request,
                                                         const ResolvedTarget& target) const {
    auto tunnel = std::make_shared<UpgradeTunnel>(client, request, target, PoolFor(target.url), options_);
    tunnel->Start();
    return tunnel;
}

std::string RequestForwarder::BuildUpstreamHead(const webgate::protocol::HttpRequest& request,
                                                const webgate::protocol::Url& target,
                                                bool upgrade) {
    std::string head;
    head.reserve(512);
    head += request.method();
    head += ' ';
    head += target.PathAndQuery();
    head += " HTTP/1.1\r\n";
    head += "Host: ";
    head += target.Authority();
    head += "\r\n";
    // The body is relayed chunked; a Content-Length beside it would let the origin frame it differently.
    const std::string* te = request.headers().Find("Transfer-Encoding");
    const bool chunked = te && HeaderMap::ContainsIgnoreCase(*te, "chunked");
    for (const auto& field : request.headers()) {
        const std::string& name = field.first;
        if (HeaderMap::EqualsIgnoreCase(name, "Host") ||
            HeaderMap::EqualsIgnoreCase(name, "Proxy-Connection") ||
            HeaderMap::EqualsIgnoreCase(name, "Keep-Alive")) {
            continue;
        }
        if (!upgrade && HeaderMap::EqualsIgnoreCase(name, "Connection")) continue;
        if (chunked && HeaderMap::EqualsIgnoreCase(name, "Content-Length")) continue;
        head += name;
        head += ": ";
        head += field.second;
        head += "\r\n";
    }
    if (!upgrade) head += "Connection: keep-alive\r\n";
    head += "\r\n";
    return head;
}

} // namespace upstream
} // namespace webgate
