#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wrapmgr {
namespace worker {

struct DecryptOutcome {
    bool ok{false};
    std::string data;
    std::string error;
};

struct BatchOutcome {
    bool ok{false};
    std::vector<std::string> data; // input order
    std::string error;
};

struct M3u8Outcome {
    bool ok{false};
    std::string url;
    std::string error;
};

struct AccountInfo {
    std::string devToken;
    std::string mediaToken;
    std::string storefront; // optional
};

// transportError separates "no answer" (refused, timeout, reset) from a
// worker that answered but reported itself unhealthy.
struct ProbeResult {
    bool healthy{false};
    bool transportError{false};
    std::string error;
};

enum class StartError {
    kNone,
    kTwoFactorRequired,
    kAuthFailed,
    kUnavailable
};

struct StartResult {
    bool ok{false};
    StartError reason{StartError::kNone};
    std::string message;
};

const char* StartErrorName(StartError e);

// Client bound to one worker instance. Every call completes asynchronously on
// the owning loop and reports transport failures in its outcome; nothing is
// thrown past this interface. Calls on an inactive proxy fail with
// "Proxy not active".
class WorkerProxy : public std::enable_shared_from_this<WorkerProxy> {
public:
    using StartCallback = std::function<void(const StartResult&)>;
    using DecryptCallback = std::function<void(DecryptOutcome)>;
    using BatchCallback = std::function<void(BatchOutcome)>;
    using M3u8Callback = std::function<void(M3u8Outcome)>;
    using AccountCallback = std::function<void(std::optional<AccountInfo>)>;
    using ProbeCallback = std::function<void(const ProbeResult&)>;

    virtual ~WorkerProxy() = default;

    virtual void Start(StartCallback cb) = 0;
    // Idempotent. In-flight calls are left to finish on their own timeout.
    virtual void Stop() = 0;
    virtual bool IsActive() const = 0;

    // Whether DecryptBatch uses one connection for the whole batch. Fixed at
    // construction.
    virtual bool SupportsBatch() const = 0;

    virtual void Decrypt(const std::string& adamId,
                         const std::string& key,
                         std::string sample,
                         int sampleIndex,
                         DecryptCallback cb) = 0;
    virtual void DecryptBatch(const std::string& adamId,
                              const std::string& key,
                              std::vector<std::string> samples,
                              BatchCallback cb) = 0;
    virtual void GetM3u8(const std::string& adamId, M3u8Callback cb) = 0;
    // nullopt on any failure or when the tokens are missing.
    virtual void GetAccountInfo(AccountCallback cb) = 0;
    virtual void HealthCheck(double timeoutSec, ProbeCallback cb) = 0;

    // Sticky-routing key, written by the dispatcher.
    const std::string& lastAdamId() const { return lastAdamId_; }
    void setLastAdamId(const std::string& adamId) { lastAdamId_ = adamId; }

protected:
    std::string lastAdamId_;
};

using WorkerProxyPtr = std::shared_ptr<WorkerProxy>;

// What a factory needs to build a proxy for one account.
struct WorkerSpec {
    std::string instanceId;
    std::string username;
    std::string password;
    std::string region;
    std::string twoFactorCode;
};

using ProxyFactory = std::function<WorkerProxyPtr(const WorkerSpec&)>;

} // namespace worker
} // namespace wrapmgr
