#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"
#include "relay/network/Callbacks.h"
#include "relay/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>

struct ssl_ctx_st;
struct ssl_st;

namespace relay {
namespace network {

class Channel;
class EventLoop;
class Socket;

class TcpConnection : relay::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    // Client side TLS. Must be called before ConnectEstablished(). Data sent
    // before the handshake finishes is queued and flushed afterwards.
    bool EnableTlsClient(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost, std::string* error);
    bool tlsEstablished() const { return tlsState_ == kTlsEstablished; }

    // Reason for the last abnormal close (socket error, TLS failure); empty otherwise.
    const std::string& lastError() const { return lastError_; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Bytes received but not yet consumed by the message callback. Loop thread only.
    Buffer* inputBuffer() { return &inputBuffer_; }
    size_t pendingOutputBytes() const { return outputBuffer_.ReadableBytes(); }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    bool isReading() const { return reading_; }

    void SetTcpNoDelay(bool on);

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) { highWaterMarkCallback_ = cb; highWaterMark_ = highWaterMark; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection or TcpClient connects
    void ConnectEstablished();
    // Called when the owner has removed me from its bookkeeping
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsState { kTlsNone, kTlsHandshaking, kTlsEstablished, kTlsFailed };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    bool TlsDoHandshake();
    void TlsReadAll(std::chrono::system_clock::time_point receiveTime);
    ssize_t TlsReadOnce(char* buf, size_t cap, int* savedErrno);
    ssize_t TlsWriteOnce(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }
    static const char* StateToString(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
    std::string lastError_;

    ssl_st* ssl_{nullptr};
    TlsState tlsState_{kTlsNone};
    bool tlsWantWrite_{false};
};

} // namespace network
} // namespace relay
