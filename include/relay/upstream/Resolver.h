#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace relay {
namespace network {
class EventLoop;
}

namespace upstream {

// Runs blocking getaddrinfo lookups off the event loops and posts each
// result back to the loop that asked for it.
class Resolver : relay::common::noncopyable {
public:
    using Callback = std::function<void(const std::vector<relay::network::InetAddress>& addrs,
                                        const std::string& error)>;

    explicit Resolver(int numThreads = 2);
    ~Resolver();

    // cb runs on loop. Numeric hosts are answered without a lookup.
    void Resolve(relay::network::EventLoop* loop, const std::string& host, uint16_t port, Callback cb);

private:
    struct Task {
        relay::network::EventLoop* loop;
        std::string host;
        uint16_t port;
        Callback cb;
    };

    void ThreadMain();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stop_{false};
    std::vector<std::thread> threads_;
};

} // namespace upstream
} // namespace relay
