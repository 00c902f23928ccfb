#include "webgate/network/Connector.h"
#include "webgate/network/Channel.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/Socket.h"
#include "webgate/network/Timer.h"
#include "webgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace webgate {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr, double timeoutSec)
    : loop_(loop),
      serverAddr_(serverAddr),
      timeoutSec_(timeoutSec),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() = default;

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    }
}

void Connector::Stop() {
    connect_ = false;
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (timer_) timer_->Cancel();
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = ::socket(serverAddr_.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        const int err = errno;
        LOG_ERROR << "Connector::Connect socket: " << std::strerror(err);
        if (errorCallback_) errorCallback_(std::string("socket: ") + std::strerror(err));
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), serverAddr_.getSockLen());
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            Fail(sockfd, std::strerror(savedErrno));
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetErrorCallback([this]() { HandleError(); });
    channel_->EnableWriting();

    if (timeoutSec_ > 0.0) {
        if (!timer_) timer_.reset(new Timer(loop_));
        std::weak_ptr<Connector> weakSelf = shared_from_this();
        timer_->Start(timeoutSec_, [weakSelf]() {
            if (auto self = weakSelf.lock()) self->HandleTimeout();
        });
    }
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we may be inside Channel::HandleEvent
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->channel_.reset(); });
    return sockfd;
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    if (timer_) timer_->Cancel();
    const int err = Socket::SocketError(sockfd);
    if (err) {
        Fail(sockfd, std::strerror(err));
        return;
    }

    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;
    int sockfd = RemoveAndResetChannel();
    if (timer_) timer_->Cancel();
    Fail(sockfd, std::strerror(Socket::SocketError(sockfd)));
}

void Connector::HandleTimeout() {
    if (state_ != kConnecting) return;
    int sockfd = RemoveAndResetChannel();
    Fail(sockfd, "connect timed out");
}

void Connector::Fail(int sockfd, const std::string& reason) {
    ::close(sockfd);
    SetState(kDisconnected);
    LOG_WARN << "Connector: connect to " << serverAddr_.toIpPort() << " failed: " << reason;
    if (connect_ && errorCallback_) errorCallback_(reason);
}

} // namespace network
} // namespace webgate
