#include "webgate/ProxyServer.h"
#include "webgate/ProxySessionContext.h"
#include "webgate/common/Config.h"
#include "webgate/common/Logger.h"

#include <any>
#include <cstdlib>
#include <functional>

namespace webgate {

namespace {

const double kDrainPollSec = 0.05;
const double kDrainGraceSec = 2.0;

const char kUiPageHead[] = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1.0">
  <title>Web Proxy</title>
  <style>
    body {
      font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif;
      background: linear-gradient(135deg, #667eea 0%, #764ba2 100%);
      min-height: 100vh;
      display: flex;
      justify-content: center;
      align-items: center;
    }
    .box {
      background: white;
      padding: 40px;
      border-radius: 20px;
      box-shadow: 0 20px 60px rgba(0,0,0,0.2);
      max-width: 700px;
      width: 90%;
      text-align: center;
    }
    input {
      padding: 12px;
      width: 80%;
      border-radius: 8px;
      border: 2px solid #ccc;
      font-size: 16px;
    }
    button {
      padding: 12px 20px;
      background: #667eea;
      border: none;
      border-radius: 8px;
      color: white;
      cursor: pointer;
      font-weight: bold;
    }
  </style>
</head>
<body>
  <div class="box">
    <h1>Web Proxy</h1>
    <form id="proxyForm">
      <input type="text" name="url" placeholder="example: https://example.com" required />
      <button type="submit">Go</button>
    </form>
  </div>
  <script>
    document.getElementById('proxyForm').addEventListener('submit', e => {
      e.preventDefault();
      let url = e.target.url.value.trim();
      if (!url.startsWith('http://') && !url.startsWith('https://')) url = 'https://' + url;
      window.location.href = ')HTML";

const char kUiPageTail[] = R"HTML(' + url;
    });
  </script>
</body>
</html>
)HTML";

// The prefix ends up inside a JS string literal.
std::string JsEscape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        if (c == '<') {
            out += "\\x3c";
            continue;
        }
        out.push_back(c);
    }
    return out;
}

size_t SizeSetting(common::Config& conf, const std::string& section, const std::string& key,
                   size_t defaultVal) {
    const int v = conf.GetInt(section, key, static_cast<int>(defaultVal));
    if (v <= 0) {
        LOG_WARN << "[" << section << "] " << key << " = " << v << " is not positive, using " << defaultVal;
        return defaultVal;
    }
    return static_cast<size_t>(v);
}

} // namespace

ProxyOptions ProxyOptions::FromConfig(common::Config& conf) {
    ProxyOptions o;
    const int port = conf.GetInt("global", "listen_port", o.port);
    if (port > 0 && port < 65536) {
        o.port = static_cast<uint16_t>(port);
    } else {
        LOG_WARN << "[global] listen_port = " << port << " is out of range, using " << o.port;
    }
    o.threads = conf.GetInt("global", "threads", o.threads);
    if (o.threads < 0) o.threads = 0;

    o.prefix = conf.GetString("proxy", "prefix", o.prefix);
    if (o.prefix.empty() || o.prefix.front() != '/') o.prefix = "/" + o.prefix;
    if (o.prefix.back() != '/') o.prefix.push_back('/');
    o.logRequests = conf.GetBool("proxy", "log_requests", o.logRequests);
    o.maxManifestBytes = SizeSetting(conf, "proxy", "max_manifest_bytes", o.maxManifestBytes);
    o.tunnelHighWaterBytes = SizeSetting(conf, "proxy", "tunnel_high_water_bytes", o.tunnelHighWaterBytes);

    o.maxSockets = SizeSetting(conf, "upstream", "max_sockets", o.maxSockets);
    const int maxIdle = conf.GetInt("upstream", "max_idle_per_origin", static_cast<int>(o.maxIdlePerOrigin));
    o.maxIdlePerOrigin = maxIdle < 0 ? 0 : static_cast<size_t>(maxIdle);
    o.tlsVerify = conf.GetBool("upstream", "tls_verify", o.tlsVerify);
    o.caFile = conf.GetString("upstream", "ca_file", o.caFile);
    o.timeoutSec = static_cast<double>(SizeSetting(conf, "upstream", "timeout_sec", 120));
    o.resolverThreads = static_cast<int>(SizeSetting(conf, "upstream", "resolver_threads",
                                                     static_cast<size_t>(o.resolverThreads)));
    o.resolve = conf.GetList("upstream", "resolve");

    o.tlsEnable = conf.GetBool("tls", "enable", false);
    o.certPath = conf.GetString("tls", "cert_path", "");
    o.keyPath = conf.GetString("tls", "key_path", "");

    if (const char* envPort = std::getenv("PORT")) {
        char* end = nullptr;
        const long p = std::strtol(envPort, &end, 10);
        if (end != envPort && *end == '\0' && p > 0 && p < 65536) {
            o.port = static_cast<uint16_t>(p);
        } else {
            LOG_WARN << "Ignoring PORT=" << envPort;
        }
    }
    if (std::getenv("SILENT_PROXY_LOGS")) o.logRequests = false;
    return o;
}

ProxyServer::ProxyServer(network::EventLoop* loop, const ProxyOptions& options, const std::string& name)
    : loop_(loop),
      options_(options),
      upstreamTls_(std::make_unique<network::TlsContext>()),
      resolver_(std::make_unique<network::Resolver>(options.resolverThreads)),
      pipeline_(rewrite::RewritePipeline::MakeDefault(options.prefix)),
      targetResolver_(options.prefix),
      server_(std::make_unique<network::TcpServer>(loop,
                                                   network::InetAddress(options.port, options.loopbackOnly),
                                                   name)) {
    if (!upstreamTls_->InitClient(options_.tlsVerify, options_.caFile)) {
        LOG_ERROR << "Upstream TLS context setup failed";
    }

    upstream::UpstreamConnectionPool::Config poolCfg;
    poolCfg.maxSockets = options_.maxSockets;
    poolCfg.maxIdlePerOrigin = options_.maxIdlePerOrigin;
    poolCfg.connectTimeoutSec = options_.timeoutSec;
    poolCfg.name = "plain";
    plainPool_ = std::make_unique<upstream::UpstreamConnectionPool>(poolCfg, resolver_.get(), nullptr);
    poolCfg.name = "tls";
    tlsPool_ = std::make_unique<upstream::UpstreamConnectionPool>(poolCfg, resolver_.get(), upstreamTls_.get());

    upstream::ForwardOptions fwd;
    fwd.timeoutSec = options_.timeoutSec;
    fwd.maxManifestBytes = options_.maxManifestBytes;
    fwd.highWaterBytes = options_.tunnelHighWaterBytes;
    forwarder_ = std::make_unique<upstream::RequestForwarder>(plainPool_.get(), tlsPool_.get(), pipeline_.get(), fwd);

    for (const auto& spec : options_.resolve) {
        AddResolveOverride(spec);
    }

    server_->SetConnectionCallback(
        std::bind(&ProxyServer::OnConnection, this, std::placeholders::_1));
    server_->SetMessageCallback(
        std::bind(&ProxyServer::OnMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
    server_->SetWriteCompleteCallback(
        std::bind(&ProxyServer::OnWriteComplete, this, std::placeholders::_1));
    server_->SetThreadNum(options_.threads);
}

ProxyServer::~ProxyServer() {
    // No lookups may complete into pools that are about to go away.
    resolver_->Stop();
    drainTimer_.reset();
    // Idle upstream connections are destroyed on their loops before those loops exit.
    plainPool_->Shutdown();
    tlsPool_->Shutdown();
    server_.reset();
}

bool ProxyServer::AddResolveOverride(const std::string& spec) {
    std::string host;
    uint16_t port = 0;
    network::InetAddress addr;
    if (!network::Resolver::ParseOverride(spec, &host, &port, &addr)) {
        LOG_WARN << "[upstream] ignoring malformed resolve entry '" << spec << "', expected host:port=ip:port";
        return false;
    }
    resolver_->AddOverride(host, port, addr);
    LOG_INFO << "[upstream] resolve " << host << ":" << port << " -> " << addr.toIpPort();
    return true;
}

bool ProxyServer::Start() {
    if (!upstreamTls_->ok()) {
        LOG_ERROR << "Cannot start without an upstream TLS context";
        return false;
    }
    if (options_.tlsEnable && !server_->EnableTls(options_.certPath, options_.keyPath)) {
        LOG_ERROR << "TLS enable failed (cert=" << options_.certPath << ", key=" << options_.keyPath << ")";
        return false;
    }
    if (!options_.tlsVerify) {
        LOG_WARN << "[upstream] tls_verify = 0: upstream TLS certificates are NOT verified";
    }
    resolver_->Start();
    if (!server_->Start()) return false;
    LOG_INFO << "webgate listening on " << listenAddress().toIpPort() << ", prefix " << options_.prefix
             << ", threads=" << options_.threads << ", max_sockets=" << options_.maxSockets
             << ", timeout_sec=" << options_.timeoutSec << ", resolver_threads=" << resolver_->numThreads();
    return true;
}

void ProxyServer::Stop() {
    if (stopping_) return;
    stopping_ = true;
    LOG_INFO << "webgate stopping";
    server_->Stop();
    plainPool_->Shutdown();
    tlsPool_->Shutdown();
    drainTimer_ = std::make_unique<network::Timer>(loop_);
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(static_cast<int>(kDrainGraceSec * 1000));
    CheckDrained(deadline);
}

void ProxyServer::CheckDrained(std::chrono::steady_clock::time_point deadline) {
    if (server_->connectionCount() == 0 || std::chrono::steady_clock::now() >= deadline) {
        if (server_->connectionCount() > 0) {
            LOG_WARN << server_->connectionCount() << " connection(s) still open at shutdown";
        }
        loop_->Quit();
        return;
    }
    drainTimer_->Start(kDrainPollSec, [this, deadline]() { CheckDrained(deadline); });
}

std::shared_ptr<ProxySessionContext> ProxyServer::GetContext(const network::TcpConnectionPtr& conn) {
    const std::any& any = conn->GetContext();
    if (!any.has_value()) return nullptr;
    const auto* ctx = std::any_cast<std::shared_ptr<ProxySessionContext>>(&any);
    return ctx ? *ctx : nullptr;
}

void ProxyServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "New connection from " << conn->peerAddress().toIpPort();
        conn->SetContext(std::make_shared<ProxySessionContext>());
        conn->SetHighWaterMarkCallback(
            std::bind(&ProxyServer::OnHighWater, this, std::placeholders::_1, std::placeholders::_2),
            options_.tunnelHighWaterBytes);
        return;
    }

    LOG_DEBUG << "Connection closed: " << conn->name();
    auto ctx = GetContext(conn);
    if (!ctx) return;
    ctx->closing = true;
    if (ctx->forward) {
        ctx->forward->Abort();
        ctx->forward.reset();
    }
    if (ctx->tunnel) {
        ctx->tunnel->Abort();
        ctx->tunnel.reset();
    }
}

void ProxyServer::OnMessage(const network::TcpConnectionPtr& conn,
                            network::Buffer* buf,
                            std::chrono::system_clock::time_point) {
    auto ctx = GetContext(conn);
    if (!ctx || ctx->closing) {
        buf->RetrieveAll();
        return;
    }
    if (ctx->tunnel) {
        ctx->tunnel->OnClientData(buf);
        return;
    }
    if (ctx->forward) {
        // Request body; a pipelined request after it waits in buf until the response is done.
        ctx->forward->OnClientData(buf);
        return;
    }
    ProcessRequests(conn, ctx, buf);
}

void ProxyServer::ProcessRequests(const network::TcpConnectionPtr& conn,
                                  const std::shared_ptr<ProxySessionContext>& ctx,
                                  network::Buffer* buf) {
    while (!ctx->forward && !ctx->tunnel && !ctx->closing && buf->ReadableBytes() > 0) {
        protocol::HttpContext& parser = ctx->httpContext;
        if (!parser.parseRequest(buf)) {
            LOG_WARN << "Malformed request from " << conn->peerAddress().toIpPort();
            protocol::HttpResponse resp =
                protocol::HttpResponse::MakeError(protocol::HttpResponse::k400BadRequest, "Bad request", true);
            SendLocal(conn, ctx, resp);
            buf->RetrieveAll();
            return;
        }
        if (!parser.gotHead()) return;

        const protocol::HttpRequest request = parser.request();
        const protocol::BodyFramer::Mode bodyMode = parser.bodyMode();
        const uint64_t bodyLength = parser.bodyLength();
        parser.reset();
        ++ctx->requests;
        HandleRequest(conn, ctx, request, bodyMode, bodyLength, buf);
    }
}

void ProxyServer::HandleRequest(const network::TcpConnectionPtr& conn,
                                const std::shared_ptr<ProxySessionContext>& ctx,
                                const protocol::HttpRequest& request,
                                protocol::BodyFramer::Mode bodyMode,
                                uint64_t bodyLength,
                                network::Buffer* buf) {
    // Local answers never read a request body, so one makes the connection unusable.
    const bool localClose = !request.keepAlive() || bodyMode != protocol::BodyFramer::kNone;

    if (targetResolver_.Matches(request.path())) {
        upstream::ResolvedTarget target;
        std::string error;
        if (!targetResolver_.Resolve(request.target(), &target, &error)) {
            LOG_WARN << "[proxy] rejected " << request.target() << ": " << error;
            protocol::HttpResponse resp = protocol::HttpResponse::MakeError(
                protocol::HttpResponse::k400BadRequest, "Invalid target URL: " + error, true);
            resp.setHeadOnly(request.isHead());
            SendLocal(conn, ctx, resp);
            return;
        }
        if (options_.logRequests) {
            LOG_INFO << "[proxy] -> " << target.href;
        }

        if (request.isUpgrade()) {
            ctx->tunnel = forwarder_->Upgrade(conn, request, target);
            if (buf->ReadableBytes() > 0) ctx->tunnel->OnClientData(buf);
            return;
        }

        std::weak_ptr<network::TcpConnection> weakConn(conn);
        ctx->forward = forwarder_->Forward(conn, request, bodyMode, bodyLength, target,
                                           [this, weakConn](bool keepAlive) { OnExchangeDone(weakConn, keepAlive); });
        if (buf->ReadableBytes() > 0) ctx->forward->OnClientData(buf);
        return;
    }

    if (request.path() == "/" && (request.method() == "GET" || request.isHead())) {
        protocol::HttpResponse resp(localClose);
        resp.setStatusCode(protocol::HttpResponse::k200Ok);
        resp.setContentType("text/html; charset=utf-8");
        resp.setBody(std::string(kUiPageHead) + JsEscape(options_.prefix) + kUiPageTail);
        resp.setHeadOnly(request.isHead());
        SendLocal(conn, ctx, resp);
        return;
    }

    protocol::HttpResponse resp =
        protocol::HttpResponse::MakeError(protocol::HttpResponse::k404NotFound, "Not found", localClose);
    resp.setHeadOnly(request.isHead());
    SendLocal(conn, ctx, resp);
}

void ProxyServer::SendLocal(const network::TcpConnectionPtr& conn,
                            const std::shared_ptr<ProxySessionContext>& ctx,
                            protocol::HttpResponse& response) {
    network::Buffer out;
    response.appendToBuffer(&out);
    conn->Send(&out);
    if (response.closeConnection()) {
        ctx->closing = true;
        conn->Shutdown();
    }
}

void ProxyServer::OnExchangeDone(const std::weak_ptr<network::TcpConnection>& weakConn, bool keepAlive) {
    auto conn = weakConn.lock();
    if (!conn || !conn->connected()) return;
    auto ctx = GetContext(conn);
    if (!ctx) return;
    ctx->forward.reset();
    if (!keepAlive || stopping_) {
        ctx->closing = true;
        conn->Shutdown();
        return;
    }
    ProcessRequests(conn, ctx, conn->inputBuffer());
}

void ProxyServer::OnWriteComplete(const network::TcpConnectionPtr& conn) {
    auto ctx = GetContext(conn);
    if (!ctx) return;
    if (ctx->forward) ctx->forward->OnClientWriteComplete();
    if (ctx->tunnel) ctx->tunnel->OnClientWriteComplete();
}

void ProxyServer::OnHighWater(const network::TcpConnectionPtr& conn, size_t bytes) {
    auto ctx = GetContext(conn);
    if (!ctx) return;
    LOG_DEBUG << conn->name() << " output at " << bytes << " bytes, pausing upstream reads";
    if (ctx->forward) ctx->forward->OnClientHighWater();
    if (ctx->tunnel) ctx->tunnel->OnClientHighWater();
}

} // namespace webgate
