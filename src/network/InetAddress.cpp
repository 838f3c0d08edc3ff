#include "relay/network/InetAddress.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <cstdio>
#include <cstring>

namespace relay {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly, bool ipv6)
    : valid_(true) {
    std::memset(&addr6_, 0, sizeof addr6_);
    if (ipv6) {
        addr6_.sin6_family = AF_INET6;
        addr6_.sin6_addr = loopbackOnly ? in6addr_loopback : in6addr_any;
        addr6_.sin6_port = htons(port);
    } else {
        addr_.sin_family = AF_INET;
        in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
        addr_.sin_addr.s_addr = htonl(ip);
        addr_.sin_port = htons(port);
    }
}

InetAddress::InetAddress(const std::string& ip, uint16_t port)
    : valid_(false) {
    std::memset(&addr6_, 0, sizeof addr6_);
    if (ip.find(':') != std::string::npos) {
        addr6_.sin6_family = AF_INET6;
        addr6_.sin6_port = htons(port);
        valid_ = ::inet_pton(AF_INET6, ip.c_str(), &addr6_.sin6_addr) == 1;
    } else {
        addr_.sin_family = AF_INET;
        addr_.sin_port = htons(port);
        valid_ = ::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) == 1;
    }
}

InetAddress::InetAddress(const struct sockaddr_in& addr)
    : valid_(true) {
    std::memset(&addr6_, 0, sizeof addr6_);
    addr_ = addr;
}

InetAddress::InetAddress(const struct sockaddr_in6& addr)
    : valid_(true) {
    addr6_ = addr;
}

socklen_t InetAddress::sockLen() const {
    return family() == AF_INET6 ? static_cast<socklen_t>(sizeof(struct sockaddr_in6))
                                : static_cast<socklen_t>(sizeof(struct sockaddr_in));
}

void InetAddress::setSockAddr(const struct sockaddr* addr, socklen_t len) {
    std::memset(&addr6_, 0, sizeof addr6_);
    if (addr->sa_family == AF_INET6 && len >= sizeof(struct sockaddr_in6)) {
        std::memcpy(&addr6_, addr, sizeof(struct sockaddr_in6));
        valid_ = true;
    } else if (addr->sa_family == AF_INET && len >= sizeof(struct sockaddr_in)) {
        std::memcpy(&addr_, addr, sizeof(struct sockaddr_in));
        valid_ = true;
    } else {
        valid_ = false;
    }
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    if (family() == AF_INET6) {
        ::inet_ntop(AF_INET6, &addr6_.sin6_addr, buf, sizeof buf);
    } else {
        ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    }
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[80] = "";
    if (family() == AF_INET6) {
        std::snprintf(buf, sizeof buf, "[%s]:%u", toIp().c_str(), toPort());
    } else {
        std::snprintf(buf, sizeof buf, "%s:%u", toIp().c_str(), toPort());
    }
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(family() == AF_INET6 ? addr6_.sin6_port : addr_.sin_port);
}

std::vector<InetAddress> InetAddress::Resolve(const std::string& host, uint16_t port, std::string* error) {
    std::vector<InetAddress> out;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_ADDRCONFIG;

    struct addrinfo* res = nullptr;
    const std::string portStr = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        if (error) {
            *error = "getaddrinfo " + std::string(rc == EAI_NONAME ? "ENOTFOUND " : "failed for ") +
                     host + ": " + ::gai_strerror(rc);
        }
        return out;
    }

    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        InetAddress addr;
        addr.setSockAddr(ai->ai_addr, ai->ai_addrlen);
        if (addr.valid()) out.push_back(addr);
    }
    ::freeaddrinfo(res);

    if (out.empty() && error) {
        *error = "getaddrinfo returned no usable address for " + host;
    }
    return out;
}

} // namespace network
} // namespace relay
