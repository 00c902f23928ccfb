#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/network/Channel.h"
#include "webgate/network/Socket.h"

#include <functional>

namespace webgate {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : webgate::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listening() const { return listening_; }
    int fd() const { return accept_socket_.fd(); }
    // False if the address could not be bound or listened on.
    bool Listen();
    // Stops accepting; the listen socket is closed with the Acceptor.
    void StopListening();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool bound_;
    bool listening_;
    int idle_fd_;
};

} // namespace network
} // namespace webgate
