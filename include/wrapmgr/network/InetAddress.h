#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <string>

namespace wrapmgr {
namespace network {

// IPv4 endpoint.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Resolves a host name or dotted quad (blocking getaddrinfo).
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);

    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace wrapmgr
