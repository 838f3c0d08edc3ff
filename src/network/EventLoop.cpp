#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"
#include "relay/network/Poller.h"
#include "relay/network/Channel.h"

#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace relay {
namespace network {

__thread EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

static int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd: " << std::strerror(errno);
    }
    return evtfd;
}

static int CreateTimerfd() {
    int tfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        LOG_FATAL << "Failed in timerfd_create: " << std::strerror(errno);
    }
    return tfd;
}

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new Poller(this)),
      wakeup_fd_(CreateEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)),
      timer_fd_(CreateTimerfd()),
      timer_channel_(new Channel(this, timer_fd_)),
      next_timer_id_(1),
      calling_expired_timers_(false) {

    LOG_DEBUG << "EventLoop created " << this << " in thread " << thread_id_;

    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in this thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_->SetReadCallback(std::bind(&EventLoop::HandleRead, this));
    wakeup_channel_->EnableReading();
    timer_channel_->SetReadCallback(std::bind(&EventLoop::HandleTimer, this));
    timer_channel_->EnableReading();
}

EventLoop::~EventLoop() {
    timer_channel_->DisableAll();
    timer_channel_->Remove();
    ::close(timer_fd_);
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    looping_ = true;
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    while (!quit_) {
        active_channels_.clear();
        poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(std::chrono::system_clock::now());
        }
        DoPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stop looping";
    looping_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_) {
        WakeUp();
    }
}

TimerId EventLoop::RunAfter(double delaySec, Functor cb) {
    const TimerId id = next_timer_id_.fetch_add(1);
    const auto delay = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(delaySec > 0.0 ? delaySec : 0.0));
    const Clock::time_point when = Clock::now() + delay;
    RunInLoop([this, id, when, cb = std::move(cb)]() mutable {
        AddTimerInLoop(id, when, std::move(cb));
    });
    return id;
}

void EventLoop::CancelTimer(TimerId id) {
    RunInLoop([this, id]() { CancelTimerInLoop(id); });
}

void EventLoop::AddTimerInLoop(TimerId id, Clock::time_point when, Functor cb) {
    const bool earliestChanged = timers_.empty() || when < timers_.begin()->first.first;
    timers_.emplace(TimerKey(when, id), std::move(cb));
    timer_index_[id] = when;
    if (earliestChanged) {
        ResetTimerfd();
    }
}

void EventLoop::CancelTimerInLoop(TimerId id) {
    auto it = timer_index_.find(id);
    if (it != timer_index_.end()) {
        timers_.erase(TimerKey(it->second, id));
        timer_index_.erase(it);
    } else if (calling_expired_timers_) {
        canceling_timers_.insert(id);
    }
}

void EventLoop::ResetTimerfd() {
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    if (!timers_.empty()) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            timers_.begin()->first.first - Clock::now()).count();
        if (micros < 100) micros = 100;
        howlong.it_value.tv_sec = static_cast<time_t>(micros / 1000000);
        howlong.it_value.tv_nsec = static_cast<long>((micros % 1000000) * 1000);
    }
    // A zero it_value disarms the timer.
    if (::timerfd_settime(timer_fd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "EventLoop timerfd_settime: " << std::strerror(errno);
    }
}

void EventLoop::HandleTimer() {
    uint64_t howmany = 0;
    ssize_t n = ::read(timer_fd_, &howmany, sizeof howmany);
    if (n != sizeof howmany && errno != EAGAIN) {
        LOG_ERROR << "EventLoop::HandleTimer reads " << n << " bytes instead of 8";
    }

    const Clock::time_point now = Clock::now();
    std::vector<std::pair<TimerId, Functor>> expired;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        expired.emplace_back(it->first.second, std::move(it->second));
        timer_index_.erase(it->first.second);
        timers_.erase(it);
    }

    calling_expired_timers_ = true;
    canceling_timers_.clear();
    for (auto& entry : expired) {
        if (canceling_timers_.count(entry.first)) continue;
        entry.second();
    }
    calling_expired_timers_ = false;
    canceling_timers_.clear();

    ResetTimerfd();
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::wakeup() writes " << n << " bytes instead of 8";
    }
}

void EventLoop::HandleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::handleRead() reads " << n << " bytes instead of 8";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

} // namespace network
} // namespace relay
