#include "webgate/network/TcpConnection.h"
#include "webgate/network/Channel.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/Socket.h"
#include "webgate/network/TlsContext.h"
#include "webgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace webgate {
namespace network {

namespace {

const size_t kDefaultHighWaterMark = 64 * 1024 * 1024;

bool IsIpLiteral(const std::string& host) {
    unsigned char tmp[sizeof(struct in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), tmp) == 1 || ::inet_pton(AF_INET6, host.c_str(), tmp) == 1;
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(kDefaultHighWaterMark) {
    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd();
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::EnableServerTls(ssl_ctx_st* ctx) {
    if (!ctx) return;
    tlsCtx_ = ctx;
    tlsState_ = kTlsSniff;
}

bool TcpConnection::EnableClientTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost) {
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(ctx));
    if (!s) {
        tlsError_ = TlsContext::LastError();
        LOG_ERROR << "TLS: SSL_new failed for " << name_ << ": " << tlsError_;
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_connect_state(s);
    if (!serverName.empty() && !IsIpLiteral(serverName)) {
        SSL_set_tlsext_host_name(s, serverName.c_str());
    }
    if (verifyHost && !serverName.empty()) {
        SSL_set1_host(s, serverName.c_str());
    }
    tlsCtx_ = ctx;
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshake;
    return true;
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
    // Client side speaks first.
    if (ssl_ && tlsState_ == kTlsHandshake && state_ == kConnected) {
        TlsHandshake();
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::TlsSniff() {
    unsigned char b = 0;
    const ssize_t n = ::recv(channel_->fd(), &b, 1, MSG_PEEK);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return false;
        HandleError();
        HandleClose();
        return false;
    }
    if (n == 0) {
        HandleClose();
        return false;
    }

    // TLS record type 0x16 is a handshake; anything else is plaintext HTTP.
    if (b != 0x16) {
        tlsState_ = kTlsNone;
        return true;
    }

    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        TlsFail("SSL_new");
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshake;
    return true;
}

void TcpConnection::TlsHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_do_handshake(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        tlsWantWrite_ = false;
        LOG_DEBUG << "TLS established on " << name_ << " (" << SSL_get_version(s) << ")";
        if (outputBuffer_.ReadableBytes() > 0) {
            if (!channel_->IsWriting()) channel_->EnableWriting();
        } else if (channel_->IsWriting()) {
            channel_->DisableWriting();
        }
        return;
    }

    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        tlsWantWrite_ = false;
        if (channel_->IsWriting()) channel_->DisableWriting();
        return;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return;
    }
    TlsFail("handshake");
}

void TcpConnection::TlsFail(const char* what) {
    tlsError_ = TlsContext::LastError();
    if (ssl_) {
        const long verify = SSL_get_verify_result(reinterpret_cast<SSL*>(ssl_));
        if (verify != X509_V_OK) {
            tlsError_ += std::string(" (") + X509_verify_cert_error_string(verify) + ")";
        }
    }
    LOG_WARN << "TLS " << what << " failed on " << name_ << ": " << tlsError_;
    HandleClose();
}

ssize_t TcpConnection::TlsWriteOnce(const void* data, size_t len) {
    if (len == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return -2;
    tlsError_ = TlsContext::LastError();
    return -1;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsState_ == kTlsSniff) {
        if (!TlsSniff()) return;
    }
    if (tlsState_ == kTlsHandshake) {
        TlsHandshake();
        if (tlsState_ != kTlsEstablished) return;
    }

    if (tlsState_ == kTlsEstablished) {
        SSL* s = reinterpret_cast<SSL*>(ssl_);
        bool closed = false;
        size_t total = 0;
        char tmp[16 * 1024];
        // Drain everything OpenSSL has decrypted; epoll will not report it again.
        while (true) {
            const int r = SSL_read(s, tmp, sizeof tmp);
            if (r > 0) {
                inputBuffer_.Append(tmp, static_cast<size_t>(r));
                total += static_cast<size_t>(r);
                continue;
            }
            const int e = SSL_get_error(s, r);
            if (e == SSL_ERROR_WANT_READ) break;
            if (e == SSL_ERROR_WANT_WRITE) {
                if (!channel_->IsWriting()) channel_->EnableWriting();
                break;
            }
            if (e != SSL_ERROR_ZERO_RETURN) {
                tlsError_ = TlsContext::LastError();
                LOG_DEBUG << "TLS read ended on " << name_ << ": " << tlsError_;
            }
            closed = true;
            break;
        }
        if (total > 0 && messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
        if (closed) HandleClose();
        return;
    }

    int savedErrno = 0;
    const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
        LOG_DEBUG << "TcpConnection::HandleRead[" << name_ << "]: " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (tlsState_ == kTlsHandshake) {
        TlsHandshake();
        if (tlsState_ != kTlsEstablished) return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        return;
    }

    ssize_t n = 0;
    if (tlsState_ == kTlsEstablished) {
        n = TlsWriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
        if (n == -2) return;
    } else {
        n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) return;
    }

    if (n > 0) {
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                auto self = shared_from_this();
                loop_->QueueInLoop([self]() {
                    if (self->writeCompleteCallback_) self->writeCompleteCallback_(self);
                });
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else {
        LOG_DEBUG << "TcpConnection::HandleWrite[" << name_ << "] failed: " << std::strerror(errno);
        HandleClose();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose[" << name_ << "] fd = " << channel_->fd();
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::SocketError(channel_->fd());
    if (err != 0) {
        LOG_DEBUG << "TcpConnection::HandleError[" << name_ << "] SO_ERROR=" << err << " " << std::strerror(err);
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::Send(Buffer* buf) {
    if (state_ != kConnected) return;
    SendInLoop(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "disconnected, give up writing";
        return;
    }
    if (len == 0) return;

    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    // if nothing in output queue, try write directly
    if (canWriteNow() && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        if (tlsState_ == kTlsEstablished) {
            nwrote = TlsWriteOnce(data, len);
            if (nwrote == -2) {
                nwrote = 0;
            } else if (nwrote < 0) {
                nwrote = 0;
                faultError = true;
            }
        } else {
            nwrote = ::write(channel_->fd(), data, len);
            if (nwrote < 0) {
                nwrote = 0;
                if (errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_DEBUG << "TcpConnection::SendInLoop[" << name_ << "]: " << std::strerror(errno);
                    if (errno == EPIPE || errno == ECONNRESET) faultError = true;
                }
            }
        }
        remaining = len - static_cast<size_t>(nwrote);
        if (remaining == 0 && writeCompleteCallback_) {
            auto self = shared_from_this();
            loop_->QueueInLoop([self]() {
                if (self->writeCompleteCallback_) self->writeCompleteCallback_(self);
            });
        }
    }

    if (faultError) {
        HandleClose();
        return;
    }

    if (remaining > 0) {
        const size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_ && oldLen < highWaterMark_ && highWaterMarkCallback_) {
            auto self = shared_from_this();
            const size_t total = oldLen + remaining;
            loop_->QueueInLoop([self, total]() {
                if (self->highWaterMarkCallback_) self->highWaterMarkCallback_(self, total);
            });
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        // During a handshake writing is driven by TlsHandshake().
        if (canWriteNow() && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        auto self = shared_from_this();
        loop_->RunInLoop([self]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting() || outputBuffer_.ReadableBytes() > 0) return;
    if (tlsState_ == kTlsEstablished) {
        // Best effort close_notify; a short write is fine on a closing connection.
        SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
    }
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        SetState(kDisconnecting);
        auto self = shared_from_this();
        loop_->RunInLoop([self]() { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (reading_ || state_ == kDisconnected) return;
    reading_ = true;
    channel_->EnableReading();
    // Records OpenSSL already decrypted will not wake epoll again.
    if (tlsState_ == kTlsEstablished && SSL_pending(reinterpret_cast<SSL*>(ssl_)) > 0) {
        auto self = shared_from_this();
        loop_->QueueInLoop([self]() {
            if (self->reading_ && self->state_ != kDisconnected) {
                self->HandleRead(std::chrono::system_clock::now());
            }
        });
    }
}

void TcpConnection::StopReadInLoop() {
    if (!reading_ || state_ == kDisconnected) return;
    reading_ = false;
    channel_->DisableReading();
}

} // namespace network
} // namespace webgate
