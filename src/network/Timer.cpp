#include "webgate/network/Timer.h"
#include "webgate/network/EventLoop.h"
#include "webgate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/timerfd.h>
#include <unistd.h>

namespace webgate {
namespace network {

namespace {

int CreateTimerfd() {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "timerfd_create failed: " << std::strerror(errno);
    }
    return fd;
}

bool SetTimerfd(int fd, double seconds) {
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    if (seconds > 0.0) {
        const long sec = static_cast<long>(seconds);
        long nsec = static_cast<long>((seconds - static_cast<double>(sec)) * 1e9);
        if (sec == 0 && nsec < 1000000) nsec = 1000000; // 1ms floor; 0 would disarm
        howlong.it_value.tv_sec = sec;
        howlong.it_value.tv_nsec = nsec;
    }
    if (::timerfd_settime(fd, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime failed: " << std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace

Timer::Timer(EventLoop* loop)
    : loop_(loop),
      timerfd_(CreateTimerfd()),
      channel_(loop, timerfd_),
      armed_(false) {
    channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Timer::~Timer() {
    channel_.DisableAll();
    channel_.Remove();
    ::close(timerfd_);
}

void Timer::Start(double seconds, Callback cb) {
    callback_ = std::move(cb);
    if (!SetTimerfd(timerfd_, seconds > 0.0 ? seconds : 0.001)) return;
    armed_ = true;
    if (!channel_.IsReading()) channel_.EnableReading();
}

void Timer::Cancel() {
    if (!armed_) return;
    armed_ = false;
    SetTimerfd(timerfd_, 0.0);
    channel_.DisableAll();
    callback_ = nullptr;
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations || !armed_) return;

    armed_ = false;
    channel_.DisableAll();
    // Run outside Channel::HandleEvent: the callback may destroy this Timer.
    Callback cb;
    cb.swap(callback_);
    if (cb) loop_->QueueInLoop(std::move(cb));
}

} // namespace network
} // namespace webgate
