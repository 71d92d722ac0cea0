#pragma once

#include "wrapmgr/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace wrapmgr {
namespace network {

class TlsContext : wrapmgr::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Client context. caFile empty means the system trust store.
    bool InitClient(bool verifyPeer, const std::string& caFile = "");
    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Most recent OpenSSL error queue entry as text, or empty.
    static std::string LastError();

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{true};
};

} // namespace network
} // namespace wrapmgr
