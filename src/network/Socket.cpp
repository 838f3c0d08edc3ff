#include "relay/network/Socket.h"
#include "relay/network/InetAddress.h"
#include "relay/common/Logger.h"

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>

namespace relay {
namespace network {

Socket::~Socket() {
    ::close(sockfd_);
}

int Socket::CreateNonblocking(int family) {
    int sockfd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_ERROR << "Socket::CreateNonblocking: " << std::strerror(errno);
    }
    return sockfd;
}

int Socket::GetSocketError(int sockfd) {
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        return errno;
    }
    return optval;
}

InetAddress Socket::GetLocalAddr(int sockfd) {
    struct sockaddr_in6 addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    InetAddress out;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        out.setSockAddr(reinterpret_cast<struct sockaddr*>(&addr), len);
    }
    return out;
}

InetAddress Socket::GetPeerAddr(int sockfd) {
    struct sockaddr_in6 addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    InetAddress out;
    if (::getpeername(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        out.setSockAddr(reinterpret_cast<struct sockaddr*>(&addr), len);
    }
    return out;
}

bool Socket::BindAddress(const InetAddress& localaddr, std::string* error) {
    if (::bind(sockfd_, localaddr.getSockAddr(), localaddr.sockLen()) != 0) {
        if (error) *error = "bind " + localaddr.toIpPort() + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool Socket::Listen(std::string* error) {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        if (error) *error = std::string("listen: ") + std::strerror(errno);
        return false;
    }
    return true;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in6 addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(reinterpret_cast<struct sockaddr*>(&addr), len);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_DEBUG << "Socket::ShutdownWrite fd=" << sockfd_ << ": " << std::strerror(errno);
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

} // namespace network
} // namespace relay
