#include "wrapmgr/network/TcpExchange.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/network/TlsContext.h"
#include "wrapmgr/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace wrapmgr {
namespace network {

std::shared_ptr<TcpExchange> TcpExchange::Create(EventLoop* loop, const InetAddress& addr, double timeoutSec) {
    return std::shared_ptr<TcpExchange>(new TcpExchange(loop, addr, timeoutSec));
}

TcpExchange::TcpExchange(EventLoop* loop, const InetAddress& addr, double timeoutSec)
    : loop_(loop),
      addr_(addr),
      timeoutSec_(timeoutSec) {
}

TcpExchange::~TcpExchange() {
    if (ssl_) SSL_free(ssl_);
    if (sockfd_ >= 0) ::close(sockfd_);
    if (timerfd_ >= 0) ::close(timerfd_);
}

std::string TcpExchange::ErrorText(int err) {
    switch (err) {
        case ECONNREFUSED: return "Connection refused";
        case ETIMEDOUT: return "Socket timeout";
        case ECONNRESET:
        case EPIPE: return "Connection closed";
        default: return std::strerror(err);
    }
}

void TcpExchange::Connect(DoneCallback onConnected, ErrorCallback onError) {
    connected_ = std::move(onConnected);
    onError_ = std::move(onError);

    auto self = shared_from_this();
    // Setup failures are reported through the loop so the caller never sees
    // a callback from inside Connect().
    auto failLater = [self](const std::string& error) {
        self->loop_->QueueInLoop([self, error]() { self->Fail(error); });
    };

    sockfd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd_ < 0) {
        const int err = errno;
        LOG_ERROR << "TcpExchange socket error: " << std::strerror(err);
        failLater(ErrorText(err));
        return;
    }

    timerfd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerfd_ < 0) {
        const int err = errno;
        LOG_ERROR << "TcpExchange timerfd error: " << std::strerror(err);
        failLater(ErrorText(err));
        return;
    }

    connChannel_ = std::make_shared<Channel>(loop_, sockfd_);
    connChannel_->SetWriteCallback([self]() { self->OnWritable(); });
    connChannel_->SetReadCallback([self]() { self->OnReadable(); });
    connChannel_->SetErrorCallback([self]() {
        int err = 0;
        socklen_t len = sizeof err;
        if (::getsockopt(self->sockfd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) err = errno;
        self->Fail(ErrorText(err ? err : ECONNRESET));
    });

    timerChannel_ = std::make_shared<Channel>(loop_, timerfd_);
    timerChannel_->SetReadCallback([self]() { self->OnTimeout(); });
    timerChannel_->EnableReading();
    ArmTimer();

    int ret = ::connect(sockfd_, addr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;
    if (ret == 0 || savedErrno == EISCONN) {
        connecting_ = true;
        loop_->QueueInLoop([self]() { self->OnWritable(); });
    } else if (savedErrno == EINPROGRESS) {
        connecting_ = true;
        connChannel_->EnableWriting();
    } else {
        failLater(ErrorText(savedErrno));
    }
}

void TcpExchange::StartTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyName, DoneCallback onReady) {
    if (closed_) return;
    auto self = shared_from_this();

    ssl_ = SSL_new(ctx);
    if (!ssl_) {
        const std::string error = "TLS setup failed: " + TlsContext::LastError();
        loop_->QueueInLoop([self, error]() { self->Fail(error); });
        return;
    }
    SSL_set_fd(ssl_, sockfd_);
    SSL_set_connect_state(ssl_);
    if (!serverName.empty()) {
        SSL_set_tlsext_host_name(ssl_, serverName.c_str());
        if (verifyName) SSL_set1_host(ssl_, serverName.c_str());
    }

    handshaking_ = true;
    tlsReady_ = std::move(onReady);
    ArmTimer();
    loop_->QueueInLoop([self]() {
        if (!self->closed_ && self->handshaking_) self->DoHandshake();
    });
}

void TcpExchange::DoHandshake() {
    ERR_clear_error();
    const int r = SSL_connect(ssl_);
    if (r == 1) {
        handshaking_ = false;
        if (connChannel_->IsWriting()) connChannel_->DisableWriting();
        DisarmTimerIfIdle();
        DoneCallback cb = std::move(tlsReady_);
        tlsReady_ = nullptr;
        if (cb) cb();
        if (!closed_ && outOffset_ < out_.size()) Flush();
        return;
    }

    const int e = SSL_get_error(ssl_, r);
    if (e == SSL_ERROR_WANT_READ) {
        if (connChannel_->IsWriting()) connChannel_->DisableWriting();
        return;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!connChannel_->IsWriting()) connChannel_->EnableWriting();
        return;
    }

    std::string reason;
    const long verify = SSL_get_verify_result(ssl_);
    if (verify != X509_V_OK) {
        reason = X509_verify_cert_error_string(verify);
    } else {
        reason = TlsContext::LastError();
    }
    if (reason.empty()) reason = "error " + std::to_string(e);
    Fail("TLS handshake failed: " + reason);
}

void TcpExchange::Write(std::string data, DoneCallback onWritten) {
    if (closed_) return;
    out_ = std::move(data);
    outOffset_ = 0;
    written_ = std::move(onWritten);
    ArmTimer();
    Flush();
}

void TcpExchange::ReadExactly(size_t n, DataCallback cb) {
    PendingRead read;
    read.complete = [n](const std::string& buffer, size_t* consumed) {
        if (buffer.size() < n) return false;
        *consumed = n;
        return true;
    };
    read.expected = n;
    read.cb = std::move(cb);
    StartRead(std::move(read));
}

void TcpExchange::ReadLine(DataCallback cb) {
    PendingRead read;
    read.complete = [](const std::string& buffer, size_t* consumed) {
        const size_t pos = buffer.find('\n');
        if (pos == std::string::npos) return false;
        *consumed = pos + 1;
        return true;
    };
    read.deliverOnEof = true;
    read.cb = [cb](std::string data) {
        if (!data.empty() && data.back() == '\n') data.pop_back();
        cb(std::move(data));
    };
    StartRead(std::move(read));
}

void TcpExchange::ReadUntil(CompletePredicate complete, bool deliverOnEof, DataCallback cb) {
    PendingRead read;
    read.complete = std::move(complete);
    read.deliverOnEof = deliverOnEof;
    read.cb = std::move(cb);
    StartRead(std::move(read));
}

void TcpExchange::StartRead(PendingRead read) {
    if (closed_) return;
    read_ = std::move(read);
    read_.active = true;
    ArmTimer();
    TryCompleteRead(true);
}

void TcpExchange::OnWritable() {
    if (closed_) return;

    if (connecting_) {
        int err = 0;
        socklen_t len = sizeof err;
        if (::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
        }
        if (err) {
            Fail(ErrorText(err));
            return;
        }
        connecting_ = false;
        connChannel_->DisableWriting();
        connChannel_->EnableReading();
        DisarmTimerIfIdle();
        DoneCallback cb = std::move(connected_);
        connected_ = nullptr;
        if (cb) cb();
        if (!closed_ && outOffset_ < out_.size()) Flush();
        return;
    }

    if (handshaking_) {
        DoHandshake();
        return;
    }
    Flush();
}

void TcpExchange::Flush() {
    if (connecting_ || handshaking_) return; // resumed once connected

    while (outOffset_ < out_.size()) {
        const char* p = out_.data() + outOffset_;
        const size_t left = out_.size() - outOffset_;
        if (ssl_) {
            // A retry after WANT_* must pass the same buffer and length.
            const int n = SSL_write(ssl_, p, static_cast<int>(left));
            if (n > 0) {
                outOffset_ += static_cast<size_t>(n);
                continue;
            }
            const int e = SSL_get_error(ssl_, n);
            if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) {
                if (!connChannel_->IsWriting()) connChannel_->EnableWriting();
                return;
            }
            Fail("Connection closed");
            return;
        }
        const ssize_t n = ::send(sockfd_, p, left, MSG_NOSIGNAL);
        if (n > 0) {
            outOffset_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!connChannel_->IsWriting()) connChannel_->EnableWriting();
            return;
        }
        Fail(ErrorText(n < 0 ? errno : EPIPE));
        return;
    }

    if (connChannel_->IsWriting()) connChannel_->DisableWriting();
    out_.clear();
    outOffset_ = 0;
    DisarmTimerIfIdle();
    DoneCallback cb = std::move(written_);
    written_ = nullptr;
    if (cb) cb();
}

void TcpExchange::OnReadable() {
    if (closed_) return;

    if (handshaking_) {
        DoHandshake();
        return;
    }
    if (ssl_) {
        if (ReadTls()) TryCompleteRead(false);
        return;
    }

    char buf[16384];
    while (true) {
        const ssize_t n = ::recv(sockfd_, buf, sizeof(buf), 0);
        if (n > 0) {
            in_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            peerClosed_ = true;
            // EOF stays readable in level-triggered mode.
            connChannel_->DisableReading();
            break;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        if (errno == EINTR) continue;
        Fail(ErrorText(errno));
        return;
    }

    TryCompleteRead(false);
}

bool TcpExchange::ReadTls() {
    char buf[16384];
    while (true) {
        const int n = SSL_read(ssl_, buf, sizeof(buf));
        if (n > 0) {
            in_.append(buf, static_cast<size_t>(n));
            continue;
        }
        const int e = SSL_get_error(ssl_, n);
        if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) return true;
        if (e == SSL_ERROR_ZERO_RETURN || (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && n == 0)) {
            peerClosed_ = true;
            connChannel_->DisableReading();
            return true;
        }
        ERR_clear_error();
        Fail("Connection closed");
        return false;
    }
}

void TcpExchange::TryCompleteRead(bool deferred) {
    if (closed_ || !read_.active) return;

    size_t consumed = 0;
    std::string data;
    if (read_.complete(in_, &consumed)) {
        data = in_.substr(0, consumed);
        in_.erase(0, consumed);
    } else if (peerClosed_) {
        if (!read_.deliverOnEof) {
            if (read_.expected > 0) {
                Fail("Incomplete read (got " + std::to_string(in_.size()) + "/" +
                     std::to_string(read_.expected) + " bytes)");
            } else {
                Fail("Connection closed");
            }
            return;
        }
        data.swap(in_);
    } else {
        return;
    }

    DataCallback cb = std::move(read_.cb);
    read_ = PendingRead();
    DisarmTimerIfIdle();

    if (deferred) {
        auto self = shared_from_this();
        loop_->QueueInLoop([self, cb = std::move(cb), data = std::move(data)]() mutable {
            if (!self->closed_ && cb) cb(std::move(data));
        });
    } else if (cb) {
        cb(std::move(data));
    }
}

void TcpExchange::OnTimeout() {
    uint64_t one = 0;
    ssize_t n = ::read(timerfd_, &one, sizeof one);
    (void)n;
    Fail("Socket timeout");
}

void TcpExchange::ArmTimer() {
    if (timerfd_ < 0) return;
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = static_cast<time_t>(timeoutSec_);
    howlong.it_value.tv_nsec = static_cast<long>((timeoutSec_ - static_cast<double>(howlong.it_value.tv_sec)) * 1e9);
    if (howlong.it_value.tv_sec == 0 && howlong.it_value.tv_nsec == 0) howlong.it_value.tv_nsec = 1000000;
    ::timerfd_settime(timerfd_, 0, &howlong, nullptr);
}

void TcpExchange::DisarmTimerIfIdle() {
    if (timerfd_ < 0) return;
    if (connecting_ || handshaking_ || read_.active || outOffset_ < out_.size()) return;
    struct itimerspec off;
    std::memset(&off, 0, sizeof off);
    ::timerfd_settime(timerfd_, 0, &off, nullptr);
}

void TcpExchange::Fail(const std::string& error) {
    if (closed_) return;
    ErrorCallback cb = std::move(onError_);
    onError_ = nullptr;
    LOG_DEBUG << "TcpExchange " << addr_.toIpPort() << " failed: " << error;
    Close();
    if (cb) cb(error);
}

void TcpExchange::Close() {
    if (closed_) return;
    closed_ = true;

    if (connChannel_) {
        connChannel_->ClearCallbacks();
        connChannel_->Detach();
    }
    if (timerChannel_) {
        timerChannel_->ClearCallbacks();
        timerChannel_->Detach();
    }
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
    if (timerfd_ >= 0) {
        ::close(timerfd_);
        timerfd_ = -1;
    }

    // Channels may still sit in the poller's active list for this iteration.
    auto conn = std::move(connChannel_);
    auto timer = std::move(timerChannel_);
    loop_->QueueInLoop([conn, timer]() {});

    connected_ = nullptr;
    tlsReady_ = nullptr;
    written_ = nullptr;
    onError_ = nullptr;
    read_ = PendingRead();
}

} // namespace network
} // namespace wrapmgr
