#pragma once

#include "relay/common/noncopyable.h"
#include "relay/ForwardingHandler.h"
#include "relay/ProxyConfig.h"
#include "relay/RequestContext.h"
#include "relay/protocol/HttpServer.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace relay {
namespace upstream {
class UpstreamClient;
}

// The relayd HTTP front: GET /healthz, POST /proxy, and the bookkeeping of
// in-flight proxy exchanges that graceful shutdown needs.
class RelayServer : relay::common::noncopyable {
public:
    RelayServer(relay::network::EventLoop* loop, const ProxyConfig& config);
    ~RelayServer();

    // Sets up the upstream client and starts listening.
    bool Start(std::string* error);

    // Stops accepting, waits up to drainSec for in-flight /proxy requests,
    // then cancels what is left. onDrained runs on the base loop once
    // nothing is in flight any more. Base loop thread only.
    void Shutdown(double drainSec, std::function<void()> onDrained);

    relay::network::InetAddress listenAddress() const { return server_.listenAddress(); }
    size_t inflight() const;
    bool shuttingDown() const { return shuttingDown_; }

private:
    void OnRequest(const relay::protocol::HttpRequest& req, const relay::protocol::ResponseWriterPtr& writer);
    void HandleHealth(const relay::protocol::ResponseWriterPtr& writer);
    void HandleProxy(const relay::protocol::HttpRequest& req, const relay::protocol::ResponseWriterPtr& writer);
    void HandleNotFound(const relay::protocol::HttpRequest& req, const relay::protocol::ResponseWriterPtr& writer);
    void CheckDrained();
    void CancelInflight(const std::string& reason);

    static std::string NormalizePath(const std::string& path);

    relay::network::EventLoop* loop_;
    const ProxyConfig config_;
    relay::protocol::HttpServer server_;
    std::shared_ptr<relay::upstream::UpstreamClient> client_;
    ForwardingHandler handler_;

    // Shared with the finish handlers of the contexts, which can outlive the
    // server when a connection closes during its destruction.
    struct InflightRegistry {
        std::mutex mutex;
        std::map<uint64_t, RequestContextPtr> contexts;
    };

    std::shared_ptr<InflightRegistry> inflight_;
    std::atomic<uint64_t> nextRequestId_;
    std::atomic<bool> shuttingDown_;

    std::function<void()> onDrained_;
    std::chrono::steady_clock::time_point drainDeadline_;
    bool deadlinePassed_{false};
};

} // namespace relay
