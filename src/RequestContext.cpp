#include "relay/RequestContext.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

namespace relay {

RequestContext::RequestContext(relay::network::EventLoop* loop, uint64_t id)
    : loop_(loop),
      id_(id),
      cancelled_(false),
      finished_(false) {
}

void RequestContext::SetCancelHandler(Handler handler) {
    if (finished_) return;
    if (cancelled_) {
        if (handler) handler(cancelReason_);
        return;
    }
    cancelHandler_ = std::move(handler);
}

void RequestContext::SetFinishHandler(std::function<void()> handler) {
    finishHandler_ = std::move(handler);
}

void RequestContext::Cancel(const std::string& reason) {
    auto self = shared_from_this();
    loop_->RunInLoop([self, reason]() { self->CancelInLoop(reason); });
}

void RequestContext::CancelInLoop(const std::string& reason) {
    if (finished_ || cancelled_) return;
    cancelled_ = true;
    cancelReason_ = reason;
    LOG_DEBUG << "request#" << id_ << " cancelled: " << reason;
    Handler handler = std::move(cancelHandler_);
    cancelHandler_ = nullptr;
    if (handler) handler(reason);
}

void RequestContext::Finish() {
    if (finished_) return;
    finished_ = true;
    cancelHandler_ = nullptr;
    std::function<void()> done = std::move(finishHandler_);
    finishHandler_ = nullptr;
    if (done) done();
}

} // namespace relay
