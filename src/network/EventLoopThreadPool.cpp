#include "relay/network/EventLoopThreadPool.h"
#include "relay/network/EventLoopThread.h"
#include "relay/network/EventLoop.h"

namespace relay {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start(const ThreadInitCallback& cb) {
    started_ = true;

    for (int i = 0; i < numThreads_; ++i) {
        std::string threadName = name_ + "-io" + std::to_string(i);
        threads_.push_back(std::make_unique<EventLoopThread>(cb, threadName));
        loops_.push_back(threads_.back()->StartLoop());
    }
    if (numThreads_ == 0 && cb) {
        cb(baseLoop_);
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    EventLoop* loop = baseLoop_;

    if (!loops_.empty()) {
        loop = loops_[next_];
        ++next_;
        if (next_ >= loops_.size()) {
            next_ = 0;
        }
    }
    return loop;
}

} // namespace network
} // namespace relay
