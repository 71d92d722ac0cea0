#pragma once

#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/worker/WorkerProxy.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace wrapmgr {
namespace network {
class EventLoop;
}

namespace balancer {

enum class InstanceStatus {
    kInitializing,
    kActive,
    kFailed,
    kStopped
};

const char* InstanceStatusName(InstanceStatus s);

// One logged-in account and the proxy that reaches its worker.
// Status, timestamps and noRestart are written on the loop thread only.
struct Instance {
    std::string instanceId;
    std::string username;
    std::string region;
    InstanceStatus status{InstanceStatus::kInitializing};
    std::chrono::system_clock::time_point createdAt;
    std::chrono::steady_clock::time_point createdSteady;
    std::chrono::steady_clock::time_point lastUsed;
    std::string error;
    bool noRestart{false};
    worker::WorkerProxyPtr proxy;

    bool IsActive() const { return status == InstanceStatus::kActive && proxy != nullptr; }
    void Touch() { lastUsed = std::chrono::steady_clock::now(); }
    double IdleSeconds() const;
};

using InstancePtr = std::shared_ptr<Instance>;

class InstancePool : wrapmgr::common::noncopyable {
public:
    enum class AddFailure {
        kNone,
        kAlreadyExists,
        kTwoFactorRequired,
        kStartFailed
    };

    struct AddResult {
        bool ok{false};
        AddFailure failure{AddFailure::kNone};
        std::string message;
        InstancePtr instance; // also set for kAlreadyExists
    };

    using AddCallback = std::function<void(const AddResult&)>;
    using HealthMapCallback = std::function<void(std::map<std::string, bool>)>;

    InstancePool(network::EventLoop* loop, worker::ProxyFactory factory);
    ~InstancePool();

    // Deterministic per-account id (UUIDv5 of the username).
    static std::string MakeInstanceId(const std::string& username);

    // Builds and starts a proxy; the instance is registered only once the
    // proxy started. A second add for the same account, including one racing
    // an add still in flight, fails with kAlreadyExists. Loop thread only.
    void Add(const std::string& username,
             const std::string& password,
             const std::string& region,
             const std::string& twoFactorCode,
             AddCallback cb);

    bool Remove(const std::string& instanceId, std::string* message = nullptr);

    InstancePtr Get(const std::string& instanceId) const;
    InstancePtr GetByUsername(const std::string& username) const;
    std::vector<InstancePtr> List() const;

    // Regions of Active instances only.
    std::set<std::string> Regions() const;
    int ClientCount() const;
    size_t Size() const;

    // Probes every instance concurrently; cb gets the complete map once.
    void HealthCheckAll(double timeoutSec, HealthMapCallback cb);

    // Removes instances idle longer than maxIdleSec unless flagged noRestart.
    int CleanupIdle(double maxIdleSec);

    void ShutdownAll();

private:
    network::EventLoop* loop_;
    worker::ProxyFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, InstancePtr> instances_;
    std::map<std::string, std::string> usernameToId_;
    std::set<std::string> pending_;
    bool shutdown_{false};
};

} // namespace balancer
} // namespace wrapmgr
