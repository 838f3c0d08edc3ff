#include "relay/upstream/Resolver.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

namespace relay {
namespace upstream {

using relay::network::EventLoop;
using relay::network::InetAddress;

Resolver::Resolver(int numThreads) {
    if (numThreads < 1) numThreads = 1;
    for (int i = 0; i < numThreads; ++i) {
        threads_.emplace_back([this]() { ThreadMain(); });
    }
}

Resolver::~Resolver() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void Resolver::Resolve(EventLoop* loop, const std::string& host, uint16_t port, Callback cb) {
    InetAddress literal(host, port);
    if (literal.valid()) {
        std::vector<InetAddress> addrs{literal};
        loop->QueueInLoop([cb = std::move(cb), addrs]() { cb(addrs, std::string()); });
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(Task{loop, host, port, std::move(cb)});
    }
    cv_.notify_one();
}

void Resolver::ThreadMain() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
            if (stop_) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        std::string error;
        std::vector<InetAddress> addrs = InetAddress::Resolve(task.host, task.port, &error);
        LOG_DEBUG << "Resolver: " << task.host << " -> " << addrs.size() << " address(es)";
        task.loop->QueueInLoop([cb = std::move(task.cb), addrs = std::move(addrs), error]() {
            cb(addrs, error);
        });
    }
}

} // namespace upstream
} // namespace relay
