#pragma once

#include <vector>
#include <atomic>
#include <memory>
#include <thread>
#include <mutex>
#include <map>
#include <set>
#include <unordered_map>
#include <chrono>
#include <cstdint>

#include "relay/common/noncopyable.h"
#include "relay/network/Channel.h"
#include "relay/network/Poller.h"

namespace relay {
namespace network {

// Identifies a timer scheduled with RunAfter. Never reused within a loop.
using TimerId = uint64_t;

class EventLoop : relay::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    // One-shot timer on this loop's timerfd. Thread safe.
    TimerId RunAfter(double delaySec, Functor cb);
    // No-op when the timer already fired or was cancelled. Thread safe.
    void CancelTimer(TimerId id);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    using Clock = std::chrono::steady_clock;
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    void HandleRead(); // For wakeup
    void HandleTimer();
    void DoPendingFunctors();

    void AddTimerInLoop(TimerId id, Clock::time_point when, Functor cb);
    void CancelTimerInLoop(TimerId id);
    void ResetTimerfd();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    // wakeup fd
    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    int timer_fd_;
    std::unique_ptr<Channel> timer_channel_;
    std::atomic<TimerId> next_timer_id_;
    std::map<TimerKey, Functor> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_index_;
    bool calling_expired_timers_;
    std::set<TimerId> canceling_timers_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace relay
