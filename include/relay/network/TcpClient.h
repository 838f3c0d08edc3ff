#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/TcpConnection.h"

#include <mutex>
#include <string>
#include <vector>

namespace relay {
namespace network {

class Connector;
class EventLoop;
class TlsContext;

// Single outbound connection. Candidate addresses are tried in order until
// one accepts; the connection is never re-established once it closes.
class TcpClient : relay::common::noncopyable {
public:
    using ConnectErrorCallback = std::function<void(const std::string& reason)>;

    TcpClient(EventLoop* loop, const std::vector<InetAddress>& serverAddrs, const std::string& nameArg);
    ~TcpClient();

    // Wrap the connection in TLS once connected. ctx must outlive the client.
    void EnableTls(TlsContext* ctx, const std::string& serverName);

    void Connect();
    // Drops the connection (or the pending attempt) without further callbacks
    // from the connector.
    void Disconnect();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    const std::string& name() const { return name_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetConnectErrorCallback(const ConnectErrorCallback& cb) { connectErrorCallback_ = cb; }

    // "ECONNREFUSED" style name for common connect errors, strerror otherwise.
    static std::string ErrnoName(int savedErrno);

private:
    void StartConnector();
    void NewConnection(int sockfd);
    void ConnectFailed(int savedErrno);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::vector<InetAddress> serverAddrs_;
    size_t addrIndex_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    TlsContext* tlsCtx_;
    std::string serverName_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    ConnectErrorCallback connectErrorCallback_;

    bool connect_;
    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace relay
