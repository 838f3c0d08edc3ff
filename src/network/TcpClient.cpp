#include "relay/network/TcpClient.h"
#include "relay/network/Connector.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/network/TlsContext.h"
#include "relay/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <stdio.h>

namespace relay {
namespace network {

namespace detail {
void removeConnection(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}
} // namespace detail

TcpClient::TcpClient(EventLoop* loop, const std::vector<InetAddress>& serverAddrs, const std::string& nameArg)
    : loop_(loop),
      serverAddrs_(serverAddrs),
      addrIndex_(0),
      name_(nameArg),
      tlsCtx_(nullptr),
      connect_(false),
      nextConnId_(1) {
    LOG_DEBUG << "TcpClient::TcpClient[" << name_ << "] - " << serverAddrs_.size() << " candidate address(es)";
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "]";
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = connection_;
    }
    if (conn) {
        // RemoveConnection binds this; route the final close elsewhere.
        CloseCallback cb = std::bind(&detail::removeConnection, loop_, std::placeholders::_1);
        loop_->RunInLoop(std::bind(&TcpConnection::SetCloseCallback, conn, cb));
        conn->ForceClose();
    }
    if (connector_) {
        connector_->Stop();
    }
}

void TcpClient::EnableTls(TlsContext* ctx, const std::string& serverName) {
    tlsCtx_ = ctx;
    serverName_ = serverName;
}

std::string TcpClient::ErrnoName(int savedErrno) {
    switch (savedErrno) {
        case ECONNREFUSED: return "ECONNREFUSED";
        case ECONNRESET: return "ECONNRESET";
        case ETIMEDOUT: return "ETIMEDOUT";
        case ENETUNREACH: return "ENETUNREACH";
        case EHOSTUNREACH: return "EHOSTUNREACH";
        case EADDRNOTAVAIL: return "EADDRNOTAVAIL";
        case EPIPE: return "EPIPE";
        case EMFILE: return "EMFILE";
        default: return std::strerror(savedErrno);
    }
}

void TcpClient::Connect() {
    connect_ = true;
    addrIndex_ = 0;
    if (serverAddrs_.empty()) {
        connect_ = false;
        if (connectErrorCallback_) connectErrorCallback_("no address to connect to");
        return;
    }
    StartConnector();
}

void TcpClient::StartConnector() {
    const InetAddress& addr = serverAddrs_[addrIndex_];
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to " << addr.toIpPort();
    if (connector_) connector_->Stop();
    connector_ = std::make_shared<Connector>(loop_, addr);
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
    connector_->SetErrorCallback(
        std::bind(&TcpClient::ConnectFailed, this, std::placeholders::_1));
    connector_->Start();
}

void TcpClient::ConnectFailed(int savedErrno) {
    if (!connect_) return;
    const InetAddress& addr = serverAddrs_[addrIndex_];
    if (addrIndex_ + 1 < serverAddrs_.size()) {
        LOG_DEBUG << "TcpClient[" << name_ << "] " << addr.toIpPort() << ": " << ErrnoName(savedErrno)
                  << ", trying next address";
        ++addrIndex_;
        StartConnector();
        return;
    }
    connect_ = false;
    if (connectErrorCallback_) {
        connectErrorCallback_("connect " + ErrnoName(savedErrno) + " " + addr.toIpPort());
    }
}

void TcpClient::Disconnect() {
    connect_ = false;
    if (connector_) connector_->Stop();
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->ForceClose();
    }
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = serverAddrs_[addrIndex_];
    InetAddress localAddr = Socket::GetLocalAddr(sockfd);

    char buf[64];
    snprintf(buf, sizeof buf, ":%s#%d", peerAddr.toIpPort().c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr));
    if (tlsCtx_) {
        std::string error;
        if (!conn->EnableTlsClient(tlsCtx_->ctx(), serverName_, tlsCtx_->verifyPeer(), &error)) {
            LOG_ERROR << "TcpClient[" << name_ << "] " << error;
            connect_ = false;
            // conn owns sockfd; let it go through the normal teardown.
            conn->ConnectDestroyed();
            if (connectErrorCallback_) connectErrorCallback_(error);
            return;
        }
    }

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }
    connect_ = false;
    loop_->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace relay
