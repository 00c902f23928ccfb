#include "webgate/network/InetAddress.h"

#include <arpa/inet.h>
#include <cstdio>
#include <cstring>

namespace webgate {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr6_, 0, sizeof addr6_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

bool InetAddress::FromIpPort(const std::string& ip, uint16_t port, InetAddress* out) {
    std::string literal = ip;
    if (literal.size() > 2 && literal.front() == '[' && literal.back() == ']') {
        literal = literal.substr(1, literal.size() - 2);
    }

    struct sockaddr_in v4;
    std::memset(&v4, 0, sizeof v4);
    if (::inet_pton(AF_INET, literal.c_str(), &v4.sin_addr) == 1) {
        v4.sin_family = AF_INET;
        v4.sin_port = htons(port);
        *out = InetAddress(v4);
        return true;
    }

    struct sockaddr_in6 v6;
    std::memset(&v6, 0, sizeof v6);
    if (::inet_pton(AF_INET6, literal.c_str(), &v6.sin6_addr) == 1) {
        v6.sin6_family = AF_INET6;
        v6.sin6_port = htons(port);
        *out = InetAddress(v6);
        return true;
    }
    return false;
}

void InetAddress::setSockAddr(const struct sockaddr* addr, socklen_t len) {
    std::memset(&addr6_, 0, sizeof addr6_);
    if (len > sizeof addr6_) len = sizeof addr6_;
    std::memcpy(&addr6_, addr, len);
}

std::string InetAddress::toIp() const {
    char buf[INET6_ADDRSTRLEN] = "";
    if (family() == AF_INET6) {
        ::inet_ntop(AF_INET6, &addr6_.sin6_addr, buf, sizeof buf);
    } else {
        ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    }
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[INET6_ADDRSTRLEN + 16] = "";
    if (family() == AF_INET6) {
        std::snprintf(buf, sizeof buf, "[%s]:%u", toIp().c_str(), toPort());
    } else {
        std::snprintf(buf, sizeof buf, "%s:%u", toIp().c_str(), toPort());
    }
    return buf;
}

uint16_t InetAddress::toPort() const {
    // sin_port and sin6_port share the same offset
    return ntohs(addr_.sin_port);
}

} // namespace network
} // namespace webgate
