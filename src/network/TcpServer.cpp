#include "webgate/network/TcpServer.h"
#include "webgate/network/Acceptor.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/EventLoopThreadPool.h"
#include "webgate/network/Socket.h"
#include "webgate/common/Logger.h"

#include <unistd.h>

namespace webgate {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      stopped_(false),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peerAddr) { NewConnection(sockfd, peerAddr); });
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
}

InetAddress TcpServer::listenAddress() const {
    return Socket::LocalAddress(acceptor_->fd());
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_unique<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

bool TcpServer::Start() {
    if (started_++ != 0) return acceptor_->Listening();
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer::Start [" << name_ << "] cannot listen on " << hostport_;
        return false;
    }
    threadPool_->Start();
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << listenAddress().toIpPort()
             << (tlsCtx_ ? " (tls+plain)" : "");
    return true;
}

void TcpServer::Stop() {
    if (stopped_) return;
    stopped_ = true;
    acceptor_->StopListening();
    LOG_INFO << "TcpServer [" << name_ << "] stopping, closing " << connections_.size() << " connection(s)";
    std::vector<TcpConnectionPtr> open;
    open.reserve(connections_.size());
    for (const auto& item : connections_) open.push_back(item.second);
    for (const auto& conn : open) conn->ForceClose();
}

std::vector<EventLoop*> TcpServer::GetAllLoops() const {
    return threadPool_->GetAllLoops();
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    if (stopped_) {
        ::close(sockfd);
        return;
    }

    std::string connName = name_ + "-" + hostport_ + "#" + std::to_string(next_conn_id_);
    ++next_conn_id_;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop, connName, sockfd,
                                                            Socket::LocalAddress(sockfd), peerAddr);
    if (tlsCtx_) conn->EnableServerTls(tlsCtx_->ctx());
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred: we are inside the connection's own event handling.
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());
    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace webgate
