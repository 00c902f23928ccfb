#include "webgate/network/Resolver.h"
#include "webgate/network/EventLoop.h"
#include "webgate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>

namespace webgate {
namespace network {

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool ParsePort(const std::string& s, uint16_t* port) {
    if (s.empty() || s.size() > 5) return false;
    unsigned long v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<unsigned long>(c - '0');
    }
    if (v == 0 || v > 65535) return false;
    *port = static_cast<uint16_t>(v);
    return true;
}

// "host:port" or "[v6]:port"
bool SplitHostPort(const std::string& s, std::string* host, uint16_t* port) {
    const size_t colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    std::string h = s.substr(0, colon);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);
    if (h.empty() || !ParsePort(s.substr(colon + 1), port)) return false;
    *host = h;
    return true;
}

} // namespace

Resolver::Resolver(int numThreads)
    : numThreads_(numThreads > 0 ? numThreads : 1),
      running_(false) {
}

Resolver::~Resolver() {
    Stop();
}

void Resolver::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    for (int i = 0; i < numThreads_; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
}

void Resolver::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        tasks_.clear();
    }
    cond_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

std::string Resolver::OverrideKey(const std::string& host, uint16_t port) {
    return ToLowerCopy(host) + ":" + std::to_string(port);
}

void Resolver::AddOverride(const std::string& host, uint16_t port, const InetAddress& addr) {
    std::lock_guard<std::mutex> lock(overridesMutex_);
    overrides_[OverrideKey(host, port)] = addr;
    LOG_INFO << "Resolver: pinned " << host << ":" << port << " -> " << addr.toIpPort();
}

bool Resolver::LookupOverride(const std::string& host, uint16_t port, InetAddress* out) const {
    std::lock_guard<std::mutex> lock(overridesMutex_);
    auto it = overrides_.find(OverrideKey(host, port));
    if (it == overrides_.end()) return false;
    *out = it->second;
    return true;
}

bool Resolver::ParseOverride(const std::string& spec, std::string* host, uint16_t* port, InetAddress* addr) {
    const size_t eq = spec.find('=');
    if (eq == std::string::npos) return false;
    std::string ip;
    uint16_t ipPort = 0;
    if (!SplitHostPort(spec.substr(0, eq), host, port)) return false;
    if (!SplitHostPort(spec.substr(eq + 1), &ip, &ipPort)) return false;
    return InetAddress::FromIpPort(ip, ipPort, addr);
}

bool Resolver::ResolveBlocking(const std::string& host, uint16_t port, InetAddress* out, std::string* error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_ADDRCONFIG;

    struct addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0 || !res) {
        if (error) *error = std::string("cannot resolve ") + host + ": " + ::gai_strerror(gai);
        if (res) ::freeaddrinfo(res);
        return false;
    }
    bool ok = false;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET || ai->ai_family == AF_INET6) {
            out->setSockAddr(ai->ai_addr, ai->ai_addrlen);
            ok = true;
            break;
        }
    }
    ::freeaddrinfo(res);
    if (!ok && error) *error = "no usable address for " + host;
    return ok;
}

void Resolver::Resolve(EventLoop* loop, const std::string& host, uint16_t port, Callback cb) {
    InetAddress addr;
    if (LookupOverride(host, port, &addr) || InetAddress::FromIpPort(host, port, &addr)) {
        loop->QueueInLoop([cb, addr]() { cb(true, addr, std::string()); });
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            tasks_.push_back(Task{loop, host, port, std::move(cb)});
            cond_.notify_one();
            return;
        }
    }
    LOG_ERROR << "Resolver: lookup of " << host << " requested while stopped";
    loop->QueueInLoop([cb, addr]() { cb(false, addr, "resolver stopped"); });
}

void Resolver::WorkerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this]() { return !running_ || !tasks_.empty(); });
            if (!running_) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        InetAddress addr;
        std::string error;
        const bool ok = ResolveBlocking(task.host, task.port, &addr, &error);
        LOG_DEBUG << "Resolver: " << task.host << ":" << task.port << " -> "
                  << (ok ? addr.toIpPort() : error);

        Callback cb = std::move(task.cb);
        task.loop->QueueInLoop([cb, ok, addr, error]() { cb(ok, addr, error); });
    }
}

} // namespace network
} // namespace webgate
