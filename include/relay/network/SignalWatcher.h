#pragma once

#include "relay/common/noncopyable.h"

#include <functional>
#include <initializer_list>
#include <memory>
#include <signal.h>

namespace relay {
namespace network {

class Channel;
class EventLoop;

// Delivers signals through a signalfd registered on an EventLoop. The
// signals are blocked for the calling thread, so construct it before any
// other thread is started (threads inherit the mask).
class SignalWatcher : relay::common::noncopyable {
public:
    using Callback = std::function<void(int signo)>;

    SignalWatcher(EventLoop* loop, std::initializer_list<int> signals, Callback cb);
    ~SignalWatcher();

    bool ok() const { return fd_ >= 0; }

private:
    void HandleRead();

    EventLoop* loop_;
    sigset_t mask_;
    int fd_;
    std::unique_ptr<Channel> channel_;
    Callback callback_;
};

} // namespace network
} // namespace relay
