#include "webgate/network/EventLoop.h"
#include "webgate/network/Timer.h"
#include "webgate/common/Logger.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

using namespace webgate::network;
using namespace webgate::common;

void testCrossThreadQuit() {
    EventLoop loop;
    std::atomic<bool> ran{false};

    std::thread t([&loop, &ran]() {
        loop.QueueInLoop([&ran]() { ran = true; });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        LOG_INFO << "Quitting main loop from thread";
        loop.Quit();
    });

    loop.Loop();
    t.join();
    assert(ran.load());
    LOG_INFO << "Cross-thread quit PASS";
}

void testTimerRearmAndCancel() {
    EventLoop loop;
    Timer rearmed(&loop);
    Timer cancelled(&loop);
    Timer stopper(&loop);
    int rearmedFired = 0;
    bool cancelledFired = false;
    const auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration firedAfter{};

    rearmed.Start(0.05, [&]() { ++rearmedFired; });
    // Second Start replaces the first deadline and callback.
    rearmed.Start(0.2, [&]() {
        ++rearmedFired;
        firedAfter = std::chrono::steady_clock::now() - start;
    });
    cancelled.Start(0.05, [&]() { cancelledFired = true; });
    loop.RunInLoop([&]() { cancelled.Cancel(); });
    stopper.Start(0.4, [&loop]() { loop.Quit(); });

    loop.Loop();
    assert(rearmedFired == 1);
    assert(firedAfter >= std::chrono::milliseconds(190));
    assert(!cancelledFired);
    assert(!rearmed.armed());
    assert(!cancelled.armed());
    LOG_INFO << "Timer re-arm and cancel PASS";
}

void testPendingFunctorsDrainOnDestruction() {
    bool ran = false;
    {
        EventLoop loop;
        loop.QueueInLoop([&ran]() { ran = true; });
    }
    assert(ran);
    LOG_INFO << "Pending functors drain PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);
    LOG_INFO << "Starting EventLoop test";
    testCrossThreadQuit();
    testTimerRearmAndCancel();
    testPendingFunctorsDrainOnDestruction();
    return 0;
}
