#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/InetAddress.h"
#include "webgate/network/Callbacks.h"
#include "webgate/network/TcpConnection.h"
#include "webgate/network/TlsContext.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace webgate {
namespace network {

class EventLoop;
class Acceptor;
class EventLoopThreadPool;

class TcpServer : webgate::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    // Actual bound address; differs from the requested one when port 0 was asked for.
    InetAddress listenAddress() const;

    void SetThreadNum(int numThreads);

    // TLS termination on the listener. Connections whose first byte is a TLS handshake
    // record are decrypted, everything else is served as plaintext.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Starts the I/O threads and listens. Call on the base loop thread.
    bool Start();
    // Stops accepting and force-closes every open connection. Base loop thread only.
    void Stop();

    // I/O loops connections are spread over. Valid after Start().
    std::vector<EventLoop*> GetAllLoops() const;
    size_t connectionCount() const { return connections_.size(); }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;
    std::unique_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    bool stopped_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace webgate
