#include "support/Acceptor.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/network/InetAddress.h"
#include "wrapmgr/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace wrapmgr {
namespace testing {

static int CreateNonblockingOrDie() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor socket: " << std::strerror(errno);
    }
    return sockfd;
}

Acceptor::Acceptor(network::EventLoop* loop, const network::InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(CreateNonblockingOrDie()),
      accept_channel_(loop, accept_socket_.fd()),
      bound_(false),
      listening_(false) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    bound_ = accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    accept_channel_.Detach();
}

bool Acceptor::Listen() {
    if (!bound_ || !accept_socket_.Listen()) return false;
    listening_ = true;
    accept_channel_.EnableReading();
    return true;
}

uint16_t Acceptor::port() const {
    return accept_socket_.LocalAddress().toPort();
}

void Acceptor::HandleRead() {
    network::InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        LOG_ERROR << "Acceptor::HandleRead: " << std::strerror(errno);
    }
}

} // namespace testing
} // namespace wrapmgr
