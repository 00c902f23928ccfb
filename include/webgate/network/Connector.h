#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/InetAddress.h"

#include <functional>
#include <memory>
#include <string>

namespace webgate {
namespace network {

class Channel;
class EventLoop;
class Timer;

// Single nonblocking connect attempt. Exactly one of the two callbacks fires unless Stop() is called.
class Connector : public std::enable_shared_from_this<Connector>,
                  webgate::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using ErrorCallback = std::function<void(const std::string& reason)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr, double timeoutSec);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { newConnectionCallback_ = cb; }
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void HandleTimeout();
    void Fail(int sockfd, const std::string& reason);
    int RemoveAndResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    double timeoutSec_;
    bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    std::unique_ptr<Timer> timer_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;
};

} // namespace network
} // namespace webgate
