#include "relay/network/Connector.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

namespace relay {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() {
    if (channel_) {
        // Destroyed while connecting: the owner gave up on this attempt.
        channel_->DisableAll();
        channel_->Remove();
        if (state_ == kConnecting) {
            ::close(channel_->fd());
        }
    }
}

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stopped before connecting";
    }
}

void Connector::Stop() {
    connect_ = false;
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = Socket::CreateNonblocking(serverAddr_.family());
    if (sockfd < 0) {
        const int savedErrno = errno;
        LOG_ERROR << "Connector::Connect socket: " << std::strerror(savedErrno);
        Fail(-1, savedErrno);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), serverAddr_.sockLen());
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            LOG_DEBUG << "Connector::Connect " << serverAddr_.toIpPort() << " failed: " << std::strerror(savedErrno);
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback(std::bind(&Connector::HandleWrite, this));
    channel_->SetErrorCallback(std::bind(&Connector::HandleError, this));
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we are inside Channel::HandleEvent
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    int err = Socket::GetSocketError(sockfd);
    if (err) {
        LOG_DEBUG << "Connector::HandleWrite - SO_ERROR = " << err << " " << std::strerror(err);
        Fail(sockfd, err);
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
    int err = Socket::GetSocketError(sockfd);
    LOG_DEBUG << "Connector::HandleError - SO_ERROR = " << err << " " << std::strerror(err);
    Fail(sockfd, err != 0 ? err : ECONNREFUSED);
}

void Connector::Fail(int sockfd, int savedErrno) {
    if (sockfd >= 0) ::close(sockfd);
    SetState(kDisconnected);
    // Deferred: the owner typically replaces this connector from the callback.
    auto self = shared_from_this();
    loop_->QueueInLoop([self, savedErrno]() {
        if (self->connect_ && self->errorCallback_) {
            self->errorCallback_(savedErrno);
        }
    });
}

} // namespace network
} // namespace relay
