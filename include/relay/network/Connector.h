#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"

#include <functional>
#include <memory>
#include <atomic>

namespace relay {
namespace network {

class Channel;
class EventLoop;

// One non-blocking connect attempt. There is no retry; the owner decides
// whether to try another address when the error callback fires.
class Connector : public std::enable_shared_from_this<Connector>,
                  relay::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using ErrorCallback = std::function<void(int savedErrno)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int savedErrno);
    int RemoveAndResetChannel();
    void ResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    std::atomic<bool> connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;
};

} // namespace network
} // namespace relay
