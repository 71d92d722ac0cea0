#pragma once

#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/network/InetAddress.h"

namespace wrapmgr {
namespace testing {

// Owns a socket fd and closes it on destruction.
class Socket : wrapmgr::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const network::InetAddress& localaddr);
    bool Listen();
    int Accept(network::InetAddress* peeraddr);
    // Address actually bound (resolves port 0 to the kernel-chosen port).
    network::InetAddress LocalAddress() const;

    void SetReuseAddr(bool on);
    void SetReusePort(bool on);

private:
    const int sockfd_;
};

} // namespace testing
} // namespace wrapmgr
