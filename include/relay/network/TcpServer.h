#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"
#include "relay/network/Callbacks.h"
#include "relay/network/TcpConnection.h"
#include "relay/network/EventLoopThreadPool.h"

#include <map>
#include <string>
#include <atomic>
#include <memory>

namespace relay {
namespace network {

class EventLoop;
class Acceptor;

class TcpServer : relay::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    void SetThreadNum(int numThreads);

    // Binds, listens and starts the I/O threads. Call from the loop thread
    // before EventLoop::Loop(). Returns false when the port cannot be bound.
    bool Start(std::string* error);

    // Closes the listening socket. Established connections stay open.
    void StopAccepting();

    // Actual listening address; differs from the configured one for port 0.
    InetAddress listenAddress() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace relay
