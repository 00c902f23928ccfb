#include "webgate/network/TcpClient.h"
#include "webgate/network/Connector.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/Socket.h"
#include "webgate/common/Logger.h"

#include <unistd.h>

namespace webgate {
namespace network {

namespace {

void DestroyDetached(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg,
                     double connectTimeoutSec)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr, connectTimeoutSec)),
      name_(nameArg),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback([this](int sockfd) { NewConnection(sockfd); });
    connector_->SetErrorCallback([this](const std::string& reason) {
        if (errorCallback_) errorCallback_(reason);
    });
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "]";
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = std::move(connection_);
    }
    if (conn) {
        // Nobody is left to observe the connection; detach it from this client first.
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetMessageCallback(MessageCallback());
        conn->SetWriteCompleteCallback(WriteCompleteCallback());
        EventLoop* loop = loop_;
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) { DestroyDetached(loop, c); });
        if (conn->disconnected()) {
            DestroyDetached(loop_, conn);
        } else {
            conn->ForceClose();
        }
    } else {
        connector_->Stop();
    }
}

void TcpClient::EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost) {
    tlsCtx_ = ctx;
    tlsServerName_ = serverName;
    tlsVerifyHost_ = verifyHost;
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to "
              << connector_->serverAddress().toIpPort();
    connector_->Start();
}

void TcpClient::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->Shutdown();
    }
}

void TcpClient::Stop() {
    connector_->Stop();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = Socket::PeerAddress(sockfd);
    InetAddress localAddr = Socket::LocalAddress(sockfd);

    std::string connName = name_ + ":" + peerAddr.toIpPort() + "#" + std::to_string(nextConnId_);
    ++nextConnId_;

    auto conn = std::make_shared<TcpConnection>(loop_, connName, sockfd, localAddr, peerAddr);
    if (tlsCtx_ && !conn->EnableClientTls(tlsCtx_, tlsServerName_, tlsVerifyHost_)) {
        // The TcpConnection owns sockfd now and closes it when dropped.
        if (errorCallback_) errorCallback_("TLS setup failed: " + conn->tlsError());
        return;
    }

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ == conn) connection_.reset();
    }
    DestroyDetached(loop_, conn);
}

} // namespace network
} // namespace webgate
