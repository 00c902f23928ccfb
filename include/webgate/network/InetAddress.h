#pragma once

#include <netinet/in.h>
#include <string>

namespace webgate {
namespace network {

// IPv4 or IPv6 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    explicit InetAddress(const struct sockaddr_in& addr) : addr_(addr) {}
    explicit InetAddress(const struct sockaddr_in6& addr) : addr6_(addr) {}

    // Parses a numeric IPv4 or IPv6 literal. Returns false if ip is not one.
    static bool FromIpPort(const std::string& ip, uint16_t port, InetAddress* out);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr6_); }
    socklen_t getSockLen() const {
        return family() == AF_INET6 ? sizeof(struct sockaddr_in6) : sizeof(struct sockaddr_in);
    }
    void setSockAddr(const struct sockaddr* addr, socklen_t len);

private:
    union {
        struct sockaddr_in addr_;
        struct sockaddr_in6 addr6_;
    };
};

} // namespace network
} // namespace webgate
