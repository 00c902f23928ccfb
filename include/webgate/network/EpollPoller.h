#pragma once

#include "webgate/common/noncopyable.h"
#include <sys/epoll.h>
#include <chrono>
#include <unordered_map>
#include <vector>

namespace webgate {
namespace network {

class Channel;
class EventLoop;

// Level-triggered epoll demultiplexer owned by one EventLoop.
class EpollPoller : webgate::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller();

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    bool Update(int operation, Channel* channel);

    EventLoop* loop_;
    int epollfd_;
    std::vector<struct epoll_event> events_;
    // fd -> channel, including channels with no interest registered.
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace webgate
