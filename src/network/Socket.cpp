#include "webgate/network/Socket.h"
#include "webgate/network/InetAddress.h"
#include "webgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace webgate {
namespace network {

Socket::~Socket() {
    ::close(sockfd_);
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), localaddr.getSockLen()) != 0) {
        LOG_ERROR << "Socket::BindAddress " << localaddr.toIpPort() << ": " << std::strerror(errno);
        return false;
    }
    return true;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        LOG_ERROR << "Socket::Listen: " << std::strerror(errno);
        return false;
    }
    return true;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(reinterpret_cast<struct sockaddr*>(&addr), len);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        LOG_ERROR << "Socket::ShutdownWrite: " << std::strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof optval);
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetReusePort(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof optval);
}

void Socket::SetKeepAlive(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_KEEPALIVE, &optval, sizeof optval);
}

InetAddress Socket::LocalAddress(int sockfd) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    InetAddress out;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        out.setSockAddr(reinterpret_cast<struct sockaddr*>(&addr), len);
    }
    return out;
}

InetAddress Socket::PeerAddress(int sockfd) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    InetAddress out;
    if (::getpeername(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        out.setSockAddr(reinterpret_cast<struct sockaddr*>(&addr), len);
    }
    return out;
}

int Socket::SocketError(int sockfd) {
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        return errno;
    }
    return optval;
}

} // namespace network
} // namespace webgate
