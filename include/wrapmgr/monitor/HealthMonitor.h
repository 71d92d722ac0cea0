#pragma once

#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/network/EventLoop.h"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace wrapmgr {
namespace monitor {

enum class HealthStatus {
    kHealthy,
    kDegraded,  // answered, but reported itself unhealthy
    kUnhealthy, // no answer
    kRecovering
};

const char* HealthStatusName(HealthStatus s);

struct HealthCheckResult {
    std::string instanceId;
    HealthStatus status{HealthStatus::kHealthy};
    std::chrono::system_clock::time_point timestamp;
    std::string error;
    std::optional<double> responseTimeMs;
    int consecutiveFailures{0};
};

struct RecoveryAction {
    std::string instanceId;
    std::string actionType{"restart"};
    std::string reason;
    std::chrono::system_clock::time_point timestamp;
};

struct HealthMetrics {
    int totalChecks{0};
    int healthyCount{0};
    int unhealthyCount{0};
    double avgResponseTimeMs{0.0}; // rounded to two decimals
    int consecutiveFailures{0};
    int recoveryAttempts{0};
    bool hasLastCheck{false};
    std::chrono::system_clock::time_point lastCheck;
    HealthStatus lastStatus{HealthStatus::kHealthy};

    std::string ToJson() const;
};

// Periodically probes every instance in the pool and restarts the proxies of
// instances that stop answering. Restarts are bounded per instance by an
// attempt limit and an exponential backoff between attempts; an instance that
// exhausts its attempts is marked Failed and left alone.
//
// Everything except the const accessors runs on the loop thread.
class HealthMonitor : wrapmgr::common::noncopyable {
public:
    struct Options {
        double intervalSec{30.0};
        double probeTimeoutSec{5.0};
        int failureThreshold{3};
        bool recoveryEnabled{true};
        int maxRecoveryAttempts{5};
        double backoffBaseSec{30.0}; // wait base * 2^attempts between restarts
        double restartPauseSec{1.0};
        double recheckDelaySec{2.0};
        size_t historyLimit{100};
    };

    using HealthChangeCallback = std::function<void(const std::string& instanceId, const HealthCheckResult& result)>;
    using RecoveryStartCallback = std::function<void(const RecoveryAction& action)>;
    using RecoveryCompleteCallback = std::function<void(const std::string& instanceId, bool success, const std::string& message)>;

    HealthMonitor(network::EventLoop* loop, balancer::InstancePool* pool);
    HealthMonitor(network::EventLoop* loop, balancer::InstancePool* pool, Options options);
    ~HealthMonitor();

    void SetHealthChangeCallback(HealthChangeCallback cb) { healthChangeCb_ = std::move(cb); }
    void SetRecoveryStartCallback(RecoveryStartCallback cb) { recoveryStartCb_ = std::move(cb); }
    void SetRecoveryCompleteCallback(RecoveryCompleteCallback cb) { recoveryCompleteCb_ = std::move(cb); }

    // Both idempotent. Stop() does not cancel a recovery already in progress.
    void Start();
    void Stop();
    bool running() const { return running_; }

    // One full round of probes; done runs after every result was processed.
    void RunOnce(std::function<void()> done);

    std::optional<HealthStatus> GetHealthStatus(const std::string& instanceId) const;
    HealthMetrics GetMetrics(const std::string& instanceId) const;
    std::map<std::string, HealthMetrics> GetAllMetrics() const;
    bool IsRecovering(const std::string& instanceId) const;

    const Options& options() const { return options_; }

private:
    using ProbeDone = std::function<void(HealthCheckResult)>;

    void ScheduleNextTick();
    void CheckInstance(const balancer::InstancePtr& instance, ProbeDone done);
    void ProcessResult(const HealthCheckResult& result);
    void TriggerRecovery(const HealthCheckResult& result);
    void PerformRecovery(const balancer::InstancePtr& instance, std::function<void(bool, std::string)> done);
    void CompleteRecovery(const std::string& instanceId, int attempts, bool success, const std::string& message);
    int ConsecutiveFailuresLocked(const std::string& instanceId) const;
    HealthMetrics MetricsLocked(const std::string& instanceId) const;

    network::EventLoop* loop_;
    balancer::InstancePool* pool_;
    Options options_;

    bool running_{false};
    network::TimerId tickTimer_{0};
    uint64_t runGeneration_{0};

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<HealthCheckResult>> history_;
    std::map<std::string, int> recoveryAttempts_;
    std::map<std::string, std::chrono::steady_clock::time_point> lastRecovery_;
    std::set<std::string> recovering_;

    HealthChangeCallback healthChangeCb_;
    RecoveryStartCallback recoveryStartCb_;
    RecoveryCompleteCallback recoveryCompleteCb_;
};

} // namespace monitor
} // namespace wrapmgr
