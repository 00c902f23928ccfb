#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/TcpConnection.h"

#include <functional>
#include <mutex>
#include <string>

struct ssl_ctx_st;

namespace webgate {
namespace network {

class Connector;
class EventLoop;

// Owns one outbound connection. No reconnects: a failed connect or a closed
// connection is final and reported through the callbacks.
class TcpClient : webgate::common::noncopyable {
public:
    using ErrorCallback = std::function<void(const std::string& reason)>;

    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg,
              double connectTimeoutSec = 0.0);
    // Loop thread only. Force-closes the connection if it is still open.
    ~TcpClient();

    // Outbound TLS with SNI set to serverName. Call before Connect().
    void EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost);

    void Connect();
    void Disconnect();
    void Stop();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

private:
    void NewConnection(int sockfd);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    ErrorCallback errorCallback_;

    ssl_ctx_st* tlsCtx_{nullptr};
    std::string tlsServerName_;
    bool tlsVerifyHost_{false};

    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace webgate
