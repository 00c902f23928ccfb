#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/InetAddress.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace webgate {
namespace network {

class EventLoop;

// Host name resolution off the I/O threads. getaddrinfo blocks, so each worker handles one
// lookup at a time; results are delivered on the requesting loop. A static override table
// is consulted first.
class Resolver : webgate::common::noncopyable {
public:
    using Callback = std::function<void(bool ok, const InetAddress& addr, const std::string& error)>;

    explicit Resolver(int numThreads = 8);
    ~Resolver();

    void Start();
    int numThreads() const { return numThreads_; }
    // Joins the workers; queued lookups are dropped without a callback.
    void Stop();

    // Pins host:port to a fixed address. Thread safe.
    void AddOverride(const std::string& host, uint16_t port, const InetAddress& addr);
    bool LookupOverride(const std::string& host, uint16_t port, InetAddress* out) const;

    // Parses "host:port=ip:port". The ip may be a bracketed IPv6 literal.
    static bool ParseOverride(const std::string& spec, std::string* host, uint16_t* port, InetAddress* addr);

    // cb runs on loop. Numeric addresses and overrides complete without a worker round trip.
    void Resolve(EventLoop* loop, const std::string& host, uint16_t port, Callback cb);

    // Blocking getaddrinfo, first result.
    static bool ResolveBlocking(const std::string& host, uint16_t port, InetAddress* out, std::string* error);

private:
    struct Task {
        EventLoop* loop;
        std::string host;
        uint16_t port;
        Callback cb;
    };

    static std::string OverrideKey(const std::string& host, uint16_t port);
    void WorkerLoop();

    const int numThreads_;
    std::vector<std::thread> workers_;

    std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Task> tasks_;
    bool running_;

    mutable std::mutex overridesMutex_;
    std::map<std::string, InetAddress> overrides_;
};

} // namespace network
} // namespace webgate
