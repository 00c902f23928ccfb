#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/Channel.h"

#include <functional>

namespace webgate {
namespace network {

class EventLoop;

// One-shot timerfd bound to a loop. Start/Cancel/destruction on the loop thread only.
class Timer : webgate::common::noncopyable {
public:
    using Callback = std::function<void()>;

    explicit Timer(EventLoop* loop);
    ~Timer();

    // Re-arms if already running.
    void Start(double seconds, Callback cb);
    void Cancel();
    bool armed() const { return armed_; }

private:
    void HandleRead();

    EventLoop* loop_;
    const int timerfd_;
    Channel channel_;
    Callback callback_;
    bool armed_;
};

} // namespace network
} // namespace webgate
