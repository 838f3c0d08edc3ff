#pragma once

#include "relay/common/noncopyable.h"
#include <vector>
#include <unordered_map>
#include <chrono>
#include <sys/epoll.h>

namespace relay {
namespace network {

class Channel;
class EventLoop;

// Level-triggered epoll demultiplexer owned by one EventLoop.
class Poller : relay::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    ~Poller();

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    void Update(int operation, Channel* channel);

    using ChannelMap = std::unordered_map<int, Channel*>;
    using EventList = std::vector<struct epoll_event>;

    EventLoop* loop_;
    int epollfd_;
    EventList events_;
    ChannelMap channels_;
};

} // namespace network
} // namespace relay
