#include "webgate/network/EventLoopThread.h"
#include "webgate/network/EventLoop.h"

#include <pthread.h>

namespace webgate {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr),
      name_(name) {
}

EventLoopThread::~EventLoopThread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_ != nullptr) loop_->Quit();
    }
    if (thread_.joinable()) thread_.join();
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread([this]() { ThreadFunc(); });

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this]() { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::ThreadFunc() {
    if (!name_.empty()) {
        // Linux limits thread names to 15 chars.
        ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());
    }

    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace webgate
