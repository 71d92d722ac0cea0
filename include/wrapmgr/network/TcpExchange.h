#pragma once

#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/network/Channel.h"
#include "wrapmgr/network/InetAddress.h"

#include <functional>
#include <memory>
#include <string>

struct ssl_st;
struct ssl_ctx_st;

namespace wrapmgr {
namespace network {

class EventLoop;

// One outbound TCP conversation driven by the loop: connect, then any sequence
// of writes and framed reads. Every pending operation is bounded by the
// per-operation timeout. The first failure (refused, timeout, reset, premature
// EOF) closes the exchange and reaches the error callback exactly once; no
// other callback fires after that.
//
// StartTls() switches the exchange to a client TLS session once connected;
// later writes and reads go through it.
//
// All methods must be called on the loop thread. Callers own the exchange
// through a shared_ptr and must call Close() once they are done; an exchange
// with pending work stays alive until that work completes or fails.
class TcpExchange : public std::enable_shared_from_this<TcpExchange>,
                    wrapmgr::common::noncopyable {
public:
    using ErrorCallback = std::function<void(const std::string& error)>;
    using DoneCallback = std::function<void()>;
    using DataCallback = std::function<void(std::string data)>;
    // Inspects the inbound buffer; returns true and sets *consumed once it
    // holds a complete message.
    using CompletePredicate = std::function<bool(const std::string& buffer, size_t* consumed)>;

    static std::shared_ptr<TcpExchange> Create(EventLoop* loop, const InetAddress& addr, double timeoutSec);
    ~TcpExchange();

    void Connect(DoneCallback onConnected, ErrorCallback onError);
    // serverName goes into SNI and, with verifyName, is checked against the
    // peer certificate. onReady runs once the handshake is done.
    void StartTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyName, DoneCallback onReady);
    void Write(std::string data, DoneCallback onWritten);

    void ReadExactly(size_t n, DataCallback cb);
    // Delivers one line without its '\n'; at EOF delivers whatever is buffered.
    void ReadLine(DataCallback cb);
    // Generic framed read; at EOF either delivers the buffer or fails.
    void ReadUntil(CompletePredicate complete, bool deliverOnEof, DataCallback cb);

    void Close();
    bool closed() const { return closed_; }
    const InetAddress& peer() const { return addr_; }

private:
    TcpExchange(EventLoop* loop, const InetAddress& addr, double timeoutSec);

    struct PendingRead {
        bool active{false};
        CompletePredicate complete;
        bool deliverOnEof{false};
        size_t expected{0}; // for "Incomplete read" reporting, 0 if not fixed
        DataCallback cb;
    };

    void StartRead(PendingRead read);
    void OnWritable();
    void OnReadable();
    void OnTimeout();
    void DoHandshake();
    bool ReadTls();
    void Flush();
    void TryCompleteRead(bool deferred);
    void Fail(const std::string& error);
    void ArmTimer();
    void DisarmTimerIfIdle();

    static std::string ErrorText(int err);

    EventLoop* loop_;
    InetAddress addr_;
    double timeoutSec_;

    int sockfd_{-1};
    int timerfd_{-1};
    std::shared_ptr<Channel> connChannel_;
    std::shared_ptr<Channel> timerChannel_;

    bool connecting_{false};
    bool handshaking_{false};
    bool peerClosed_{false};
    bool closed_{false};

    ssl_st* ssl_{nullptr};

    DoneCallback connected_;
    DoneCallback tlsReady_;
    ErrorCallback onError_;

    std::string out_;
    size_t outOffset_{0};
    DoneCallback written_;

    std::string in_;
    PendingRead read_;
};

using TcpExchangePtr = std::shared_ptr<TcpExchange>;

} // namespace network
} // namespace wrapmgr
