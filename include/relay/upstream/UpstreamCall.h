#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/Callbacks.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"
#include "relay/protocol/Compression.h"
#include "relay/protocol/HttpResponseContext.h"
#include "relay/upstream/UpstreamTypes.h"

#include <memory>
#include <string>
#include <vector>

namespace relay {
namespace network {
class TcpClient;
}

namespace upstream {

class UpstreamClient;

// One POST exchange with the upstream: resolve, connect, send, parse, decode.
// Lives on a single event loop; Cancel() may be called from any thread.
class UpstreamCall : relay::common::noncopyable,
                     public std::enable_shared_from_this<UpstreamCall> {
public:
    UpstreamCall(std::shared_ptr<const UpstreamClient> client,
                 relay::network::EventLoop* loop,
                 uint64_t id,
                 UpstreamRequest request,
                 UpstreamCallbacks callbacks);
    ~UpstreamCall();

    void Start();
    // Tears the exchange down without invoking any callback.
    void Cancel();

    uint64_t id() const { return id_; }
    bool done() const { return phase_ == kDone; }

    // Wire form of the request, exposed for logging and tests.
    std::string BuildRequest() const;

private:
    enum Phase { kIdle, kResolving, kConnecting, kAwaitingHead, kReceivingBody, kDone };

    void OnResolved(const std::vector<relay::network::InetAddress>& addrs, const std::string& error);
    void OnConnection(const relay::network::TcpConnectionPtr& conn);
    void OnMessage(const relay::network::TcpConnectionPtr& conn, relay::network::Buffer* buf);
    void OnConnectError(const std::string& reason);
    void OnTimeout();

    bool ProcessHead();
    bool OpenStream();
    void OnBodyBytes(const char* data, size_t len);
    void DeliverBody(const char* data, size_t len);
    void Complete();
    void Fail(const std::string& message, bool timedOut = false);
    void Teardown();
    void ArmTimer();
    void CancelTimer();

    std::shared_ptr<const UpstreamClient> client_;
    relay::network::EventLoop* loop_;
    const uint64_t id_;
    UpstreamRequest request_;
    UpstreamCallbacks callbacks_;
    Phase phase_{kIdle};

    std::shared_ptr<relay::network::TcpClient> tcpClient_;
    relay::network::TcpConnectionPtr conn_;
    relay::network::TimerId timer_{0};
    bool timerArmed_{false};

    relay::protocol::HttpResponseContext parser_;
    bool headProcessed_{false};
    UpstreamHead head_;
    std::unique_ptr<relay::protocol::Inflater> inflater_;
    std::string decoded_;
    std::string body_;
    std::shared_ptr<ByteStream> stream_;
};

} // namespace upstream
} // namespace relay
