#pragma once

#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/network/Channel.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/network/InetAddress.h"
#include "support/Socket.h"

#include <cstdint>
#include <functional>

namespace wrapmgr {
namespace testing {

// Listening socket on a loop for the loopback stand-ins of workers and the
// catalog API; port 0 binds an ephemeral port reported by port().
class Acceptor : wrapmgr::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const network::InetAddress&)>;

    Acceptor(network::EventLoop* loop, const network::InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listening() const { return listening_; }
    bool Listen();
    uint16_t port() const;

private:
    void HandleRead();

    network::EventLoop* loop_;
    Socket accept_socket_;
    network::Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool bound_;
    bool listening_;
};

} // namespace testing
} // namespace wrapmgr
