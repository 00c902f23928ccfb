#pragma once

#include "webgate/common/noncopyable.h"
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace webgate {
namespace network {

class EventLoop;

class EventLoopThread : webgate::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace webgate
