#pragma once

#include "relay/common/noncopyable.h"
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

namespace relay {
namespace network {

class EventLoop;

class EventLoopThread : relay::common::noncopyable {
public:
    using ThreadInitCallback = std::function<void(EventLoop*)>;

    explicit EventLoopThread(const ThreadInitCallback& cb = ThreadInitCallback(),
                             const std::string& name = std::string());
    ~EventLoopThread();

    // Blocks until the loop is constructed in the new thread.
    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    ThreadInitCallback callback_;
    std::string name_;
};

} // namespace network
} // namespace relay
