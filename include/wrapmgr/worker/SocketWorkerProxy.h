#pragma once

#include "wrapmgr/worker/WorkerProxy.h"
#include "wrapmgr/network/InetAddress.h"
#include "wrapmgr/network/TcpExchange.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace wrapmgr {
namespace network {
class EventLoop;
}

namespace worker {

struct WorkerEndpoint {
    std::string host{"127.0.0.1"};
    uint16_t decryptPort{10020};
    uint16_t m3u8Port{20020};
    uint16_t accountPort{30020};
    double callTimeoutSec{30.0};
    double accountTimeoutSec{10.0};
    int m3u8Attempts{3};
    double m3u8RetryDelaySec{0.5};
    // Probe the account side-channel before reporting a successful start.
    bool verifyOnStart{true};
    bool batchDecrypt{true};
};

// Speaks the worker's socket protocols (decrypt, M3U8) and its HTTP account
// side-channel. Each call opens its own connection; a batch shares one.
class SocketWorkerProxy : public WorkerProxy {
public:
    SocketWorkerProxy(network::EventLoop* loop, std::string instanceId, WorkerEndpoint endpoint);
    ~SocketWorkerProxy() override = default;

    void Start(StartCallback cb) override;
    void Stop() override;
    bool IsActive() const override { return active_; }
    bool SupportsBatch() const override { return endpoint_.batchDecrypt; }

    void Decrypt(const std::string& adamId,
                 const std::string& key,
                 std::string sample,
                 int sampleIndex,
                 DecryptCallback cb) override;
    void DecryptBatch(const std::string& adamId,
                      const std::string& key,
                      std::vector<std::string> samples,
                      BatchCallback cb) override;
    void GetM3u8(const std::string& adamId, M3u8Callback cb) override;
    void GetAccountInfo(AccountCallback cb) override;
    void HealthCheck(double timeoutSec, ProbeCallback cb) override;

    const WorkerEndpoint& endpoint() const { return endpoint_; }

private:
    struct HttpReply {
        bool transportOk{false};
        int status{0};
        std::string body;
        std::string error;
    };
    using HttpCallback = std::function<void(const HttpReply&)>;

    struct BatchState;

    void HttpGet(const std::string& path,
                 const std::map<std::string, std::string>& headers,
                 double timeoutSec,
                 HttpCallback cb);
    static void DecryptNext(std::shared_ptr<BatchState> state);
    void M3u8Attempt(const std::string& adamId, int attempt, M3u8Callback cb);
    bool Resolve(uint16_t port, network::InetAddress* out) const;
    // Completes cb from the loop rather than from inside the caller.
    void Defer(std::function<void()> fn);

    network::EventLoop* loop_;
    std::string instanceId_;
    WorkerEndpoint endpoint_;
    bool active_{false};
    uint64_t startGeneration_{0};
};

} // namespace worker
} // namespace wrapmgr
