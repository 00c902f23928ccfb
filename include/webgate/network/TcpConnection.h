#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/Buffer.h"
#include "webgate/network/Callbacks.h"
#include "webgate/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace webgate {
namespace network {

class Channel;
class EventLoop;
class Socket;

class TcpConnection : webgate::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    // Inbound TLS termination. The first byte decides: 0x16 starts a handshake,
    // anything else is served as plaintext. Call before ConnectEstablished().
    void EnableServerTls(ssl_ctx_st* ctx);
    // Outbound TLS. The handshake starts in ConnectEstablished(); data passed to Send()
    // before it completes is held in the output buffer. serverName goes out as SNI.
    bool EnableClientTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost);
    bool tlsEstablished() const { return tlsState_ == kTlsEstablished; }
    // Reason of the last TLS failure on this connection, empty if none.
    const std::string& tlsError() const { return tlsError_; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Loop thread only; drains buf.
    void Send(Buffer* buf);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    bool isReading() const { return reading_; }

    // Loop thread only.
    Buffer* inputBuffer() { return &inputBuffer_; }
    size_t outputBytes() const { return outputBuffer_.ReadableBytes(); }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        highWaterMark_ = highWaterMark;
    }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when the owner (TcpServer / TcpClient) hands the connection over
    void ConnectEstablished();
    // Called when the owner has dropped the connection
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsState { kTlsNone, kTlsSniff, kTlsHandshake, kTlsEstablished };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    // false while the first byte has not arrived yet
    bool TlsSniff();
    void TlsHandshake();
    void TlsFail(const char* what);
    // >0 bytes, -2 retry later, -1 error
    ssize_t TlsWriteOnce(const void* data, size_t len);
    bool canWriteNow() const { return tlsState_ == kTlsNone || tlsState_ == kTlsEstablished; }

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    ssl_ctx_st* tlsCtx_{nullptr};
    ssl_st* ssl_{nullptr};
    TlsState tlsState_{kTlsNone};
    bool tlsWantWrite_{false};
    std::string tlsError_;
};

} // namespace network
} // namespace webgate
