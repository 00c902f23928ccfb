#pragma once

#include "webgate/common/noncopyable.h"
#include <memory>
#include <string>
#include <vector>

namespace webgate {
namespace network {

class EventLoop;
class EventLoopThread;

class EventLoopThreadPool : webgate::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Round robin; the base loop when no threads were started.
    EventLoop* GetNextLoop();
    // I/O loops, or just the base loop when running single threaded.
    std::vector<EventLoop*> GetAllLoops() const;

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace webgate
