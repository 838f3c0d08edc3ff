#pragma once

#include <netinet/in.h>
#include <string>
#include <vector>

namespace relay {
namespace network {

// IPv4 or IPv6 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false, bool ipv6 = false);
    // ip must be a numeric IPv4 or IPv6 literal; check valid() afterwards.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr);
    explicit InetAddress(const struct sockaddr_in6& addr);

    sa_family_t family() const { return addr_.sin_family; }
    bool valid() const { return valid_; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr6_); }
    socklen_t sockLen() const;
    void setSockAddr(const struct sockaddr* addr, socklen_t len);

    // Blocking getaddrinfo lookup for TCP. Returns an empty list and sets *error on failure.
    static std::vector<InetAddress> Resolve(const std::string& host, uint16_t port, std::string* error);

private:
    union {
        struct sockaddr_in addr_;
        struct sockaddr_in6 addr6_;
    };
    bool valid_;
};

} // namespace network
} // namespace relay
