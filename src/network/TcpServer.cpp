#include "relay/network/TcpServer.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Acceptor.h"
#include "relay/network/Socket.h"
#include "relay/common/Logger.h"

#include <functional>
#include <stdio.h>

namespace relay {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::Start(std::string* error) {
    if (started_++ != 0) return true;
    if (!acceptor_->Listen(error)) {
        return false;
    }
    threadPool_->Start();
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << acceptor_->LocalAddress().toIpPort();
    return true;
}

void TcpServer::StopAccepting() {
    loop_->RunInLoop([this]() {
        if (acceptor_->Listenning()) {
            LOG_INFO << "TcpServer [" << name_ << "] stops accepting";
            acceptor_->StopListening();
        }
    });
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->LocalAddress();
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();

    InetAddress localAddr = Socket::GetLocalAddr(sockfd);
    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Always defer removal to avoid re-entrancy inside TcpConnection event callbacks.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(
        std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace relay
