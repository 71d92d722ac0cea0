#include "wrapmgr/network/TlsContext.h"
#include "wrapmgr/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>

namespace wrapmgr {
namespace network {

TlsContext::TlsContext() {
    static std::atomic<bool> inited{false};
    bool expected = false;
    if (inited.compare_exchange_strong(expected, true)) {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

bool TlsContext::InitClient(bool verifyPeer, const std::string& caFile) {
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Servers that close after Connection: close often skip close_notify.
    SSL_CTX_set_options(c, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    verifyPeer_ = verifyPeer;
    if (verifyPeer) {
        const int loaded = caFile.empty()
            ? SSL_CTX_set_default_verify_paths(c)
            : SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr);
        if (loaded != 1) {
            LOG_ERROR << "TLS: load trust store failed: " << (caFile.empty() ? "<system>" : caFile)
                      << " " << LastError();
            SSL_CTX_free(c);
            return false;
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    ctx_ = c;
    return true;
}

std::string TlsContext::LastError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return std::string();
    char buf[256];
    ERR_error_string_n(code, buf, sizeof buf);
    ERR_clear_error();
    return buf;
}

} // namespace network
} // namespace wrapmgr
