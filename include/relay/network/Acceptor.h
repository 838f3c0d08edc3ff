#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"

#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace network {

class EventLoop;
class Socket;
class Channel;

class Acceptor : relay::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }
    // Binds and starts listening. Must run in the loop thread.
    bool Listen(std::string* error);
    // Closes the listening socket; pending backlog connections are refused.
    void StopListening();

    // Actual bound address, useful when listening on port 0.
    InetAddress LocalAddress() const;

private:
    void HandleRead();

    EventLoop* loop_;
    InetAddress listenAddr_;
    bool reuseport_;
    std::unique_ptr<Socket> accept_socket_;
    std::unique_ptr<Channel> accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
    // Reserved fd released to shed connections under EMFILE.
    int idle_fd_;
};

} // namespace network
} // namespace relay
