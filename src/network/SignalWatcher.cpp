#include "relay/network/SignalWatcher.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <sys/signalfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace relay {
namespace network {

SignalWatcher::SignalWatcher(EventLoop* loop, std::initializer_list<int> signals, Callback cb)
    : loop_(loop),
      fd_(-1),
      callback_(std::move(cb)) {
    sigemptyset(&mask_);
    for (int signo : signals) {
        sigaddset(&mask_, signo);
    }

    if (::pthread_sigmask(SIG_BLOCK, &mask_, nullptr) != 0) {
        LOG_ERROR << "SignalWatcher: pthread_sigmask failed";
        return;
    }
    fd_ = ::signalfd(-1, &mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR << "SignalWatcher: signalfd failed: " << std::strerror(errno);
        ::pthread_sigmask(SIG_UNBLOCK, &mask_, nullptr);
        return;
    }

    channel_.reset(new Channel(loop_, fd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
}

SignalWatcher::~SignalWatcher() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        ::pthread_sigmask(SIG_UNBLOCK, &mask_, nullptr);
    }
}

void SignalWatcher::HandleRead() {
    struct signalfd_siginfo info;
    while (true) {
        ssize_t n = ::read(fd_, &info, sizeof info);
        if (n != static_cast<ssize_t>(sizeof info)) {
            if (n < 0 && errno != EAGAIN) {
                LOG_ERROR << "SignalWatcher read: " << std::strerror(errno);
            }
            return;
        }
        LOG_DEBUG << "SignalWatcher caught signal " << info.ssi_signo;
        if (callback_) callback_(static_cast<int>(info.ssi_signo));
    }
}

} // namespace network
} // namespace relay
