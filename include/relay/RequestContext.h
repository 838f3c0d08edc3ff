#pragma once

#include "relay/common/noncopyable.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace network {
class EventLoop;
}

// Per-request handle shared between the handler serving a /proxy exchange and
// whoever may need to stop it early (caller disconnect, server shutdown).
// Handlers run on the request's loop; Cancel() may be called from any thread.
class RequestContext : relay::common::noncopyable,
                       public std::enable_shared_from_this<RequestContext> {
public:
    using Handler = std::function<void(const std::string& reason)>;

    RequestContext(relay::network::EventLoop* loop, uint64_t id);

    relay::network::EventLoop* loop() const { return loop_; }
    uint64_t id() const { return id_; }
    bool cancelled() const { return cancelled_; }
    bool finished() const { return finished_; }

    // Runs immediately when the context was cancelled already.
    void SetCancelHandler(Handler handler);
    void SetFinishHandler(std::function<void()> handler);

    void Cancel(const std::string& reason);
    // The exchange is over. Drops both handlers; later Cancel() calls are no-ops.
    void Finish();

private:
    void CancelInLoop(const std::string& reason);

    relay::network::EventLoop* loop_;
    const uint64_t id_;
    std::atomic<bool> cancelled_;
    std::atomic<bool> finished_;
    std::string cancelReason_;
    Handler cancelHandler_;
    std::function<void()> finishHandler_;
};

using RequestContextPtr = std::shared_ptr<RequestContext>;

} // namespace relay
