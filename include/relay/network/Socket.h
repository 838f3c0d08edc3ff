#pragma once

#include "relay/common/noncopyable.h"

#include <string>

namespace relay {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : relay::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Returns false and fills *error instead of aborting, so the caller can
    // report a busy port before serving.
    bool BindAddress(const InetAddress& localaddr, std::string* error);
    bool Listen(std::string* error);
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblocking(int family);
    static int GetSocketError(int sockfd);
    static InetAddress GetLocalAddr(int sockfd);
    static InetAddress GetPeerAddr(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace relay
