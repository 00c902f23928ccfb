#include "webgate/network/Acceptor.h"
#include "webgate/network/EventLoop.h"
#include "webgate/network/InetAddress.h"
#include "webgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace webgate {
namespace network {

namespace {

int CreateNonblocking(sa_family_t family) {
    int sockfd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor: socket() failed: " << std::strerror(errno);
    }
    return sockfd;
}

} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(CreateNonblocking(listenAddr.family())),
      accept_channel_(loop, accept_socket_.fd()),
      bound_(false),
      listening_(false),
      idle_fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    bound_ = accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
    if (idle_fd_ >= 0) ::close(idle_fd_);
}

bool Acceptor::Listen() {
    if (!bound_ || !accept_socket_.Listen()) return false;
    listening_ = true;
    accept_channel_.EnableReading();
    return true;
}

void Acceptor::StopListening() {
    if (!listening_) return;
    listening_ = false;
    accept_channel_.DisableAll();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
        return;
    }

    const int err = errno;
    if (err == EAGAIN || err == EINTR || err == ECONNABORTED) return;
    LOG_ERROR << "Acceptor::HandleRead: " << std::strerror(err);
    if (err == EMFILE && idle_fd_ >= 0) {
        // Out of fds: accept and drop so the listen queue does not spin the loop.
        ::close(idle_fd_);
        idle_fd_ = ::accept(accept_socket_.fd(), nullptr, nullptr);
        if (idle_fd_ >= 0) ::close(idle_fd_);
        idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
}

} // namespace network
} // namespace webgate
