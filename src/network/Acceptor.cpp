#include "relay/network/Acceptor.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace relay {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      listenAddr_(listenAddr),
      reuseport_(reuseport),
      listenning_(false),
      idle_fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
}

Acceptor::~Acceptor() {
    StopListening();
    if (idle_fd_ >= 0) ::close(idle_fd_);
}

bool Acceptor::Listen(std::string* error) {
    const int fd = Socket::CreateNonblocking(listenAddr_.family());
    if (fd < 0) {
        if (error) *error = std::string("socket: ") + std::strerror(errno);
        return false;
    }
    accept_socket_.reset(new Socket(fd));
    accept_socket_->SetReuseAddr(true);
    accept_socket_->SetReusePort(reuseport_);
    if (!accept_socket_->BindAddress(listenAddr_, error) || !accept_socket_->Listen(error)) {
        accept_socket_.reset();
        return false;
    }

    accept_channel_.reset(new Channel(loop_, fd));
    accept_channel_->SetReadCallback(std::bind(&Acceptor::HandleRead, this));
    accept_channel_->EnableReading();
    listenning_ = true;
    return true;
}

void Acceptor::StopListening() {
    if (accept_channel_) {
        accept_channel_->DisableAll();
        accept_channel_->Remove();
        accept_channel_.reset();
    }
    accept_socket_.reset();
    listenning_ = false;
}

InetAddress Acceptor::LocalAddress() const {
    if (!accept_socket_) return listenAddr_;
    return Socket::GetLocalAddr(accept_socket_->fd());
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_->Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int savedErrno = errno;
        if (savedErrno == EAGAIN || savedErrno == EINTR || savedErrno == ECONNABORTED) return;
        LOG_ERROR << "Acceptor::HandleRead accept: " << std::strerror(savedErrno);
        if (savedErrno == EMFILE && idle_fd_ >= 0) {
            // Level-triggered epoll would spin on the pending connection; take
            // it with the reserved fd and drop it.
            ::close(idle_fd_);
            idle_fd_ = ::accept(accept_socket_->fd(), nullptr, nullptr);
            if (idle_fd_ >= 0) ::close(idle_fd_);
            idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        }
    }
}

} // namespace network
} // namespace relay
