#include "wrapmgr/monitor/HealthMonitor.h"
#include "wrapmgr/common/Logger.h"

#include <cmath>
#include <ctime>
#include <exception>
#include <sstream>
#include <vector>

namespace wrapmgr {
namespace monitor {

namespace {

std::string IsoTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tmv;
    localtime_r(&t, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
    return buf;
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

const char* HealthStatusName(HealthStatus s) {
    switch (s) {
        case HealthStatus::kHealthy: return "healthy";
        case HealthStatus::kDegraded: return "degraded";
        case HealthStatus::kUnhealthy: return "unhealthy";
        case HealthStatus::kRecovering: return "recovering";
    }
    return "unknown";
}

std::string HealthMetrics::ToJson() const {
    std::ostringstream oss;
    oss << "{\"total_checks\":" << totalChecks
        << ",\"healthy_count\":" << healthyCount
        << ",\"unhealthy_count\":" << unhealthyCount
        << ",\"avg_response_time_ms\":" << avgResponseTimeMs
        << ",\"consecutive_failures\":" << consecutiveFailures
        << ",\"recovery_attempts\":" << recoveryAttempts;
    if (hasLastCheck) {
        oss << ",\"last_check\":\"" << IsoTime(lastCheck) << "\""
            << ",\"last_status\":\"" << HealthStatusName(lastStatus) << "\"";
    }
    oss << "}";
    return oss.str();
}

HealthMonitor::HealthMonitor(network::EventLoop* loop, balancer::InstancePool* pool)
    : HealthMonitor(loop, pool, Options()) {
}

HealthMonitor::HealthMonitor(network::EventLoop* loop, balancer::InstancePool* pool, Options options)
    : loop_(loop),
      pool_(pool),
      options_(options) {
    LOG_INFO << "Health monitor initialized (interval=" << options_.intervalSec
             << "s, threshold=" << options_.failureThreshold << ")";
}

HealthMonitor::~HealthMonitor() {
    Stop();
}

void HealthMonitor::Start() {
    if (running_) {
        LOG_WARN << "Health monitor already running";
        return;
    }
    running_ = true;
    const uint64_t generation = ++runGeneration_;
    loop_->RunInLoop([this, generation]() {
        if (!running_ || generation != runGeneration_) return;
        RunOnce([this, generation]() {
            if (running_ && generation == runGeneration_) ScheduleNextTick();
        });
    });
    LOG_INFO << "Health monitor started";
}

void HealthMonitor::Stop() {
    if (!running_) return;
    running_ = false;
    ++runGeneration_;
    if (tickTimer_ != 0) {
        loop_->Cancel(tickTimer_);
        tickTimer_ = 0;
    }
    LOG_INFO << "Health monitor stopped";
}

void HealthMonitor::ScheduleNextTick() {
    const uint64_t generation = runGeneration_;
    tickTimer_ = loop_->RunAfter(options_.intervalSec, [this, generation]() {
        tickTimer_ = 0;
        if (!running_ || generation != runGeneration_) return;
        RunOnce([this, generation]() {
            if (running_ && generation == runGeneration_) ScheduleNextTick();
        });
    });
}

void HealthMonitor::RunOnce(std::function<void()> done) {
    std::vector<balancer::InstancePtr> targets;
    for (const auto& inst : pool_->List()) {
        if (inst->status == balancer::InstanceStatus::kStopped || inst->noRestart) continue;
        if (IsRecovering(inst->instanceId)) continue;
        targets.push_back(inst);
    }

    if (targets.empty()) {
        if (done) loop_->QueueInLoop(std::move(done));
        return;
    }

    LOG_DEBUG << "Performing health checks on " << targets.size() << " instances";

    struct Round {
        std::vector<HealthCheckResult> results;
        size_t remaining{0};
        std::function<void()> done;
    };
    auto round = std::make_shared<Round>();
    round->results.resize(targets.size());
    round->remaining = targets.size();
    round->done = std::move(done);

    for (size_t i = 0; i < targets.size(); ++i) {
        CheckInstance(targets[i], [this, round, i](HealthCheckResult result) {
            round->results[i] = std::move(result);
            if (--round->remaining > 0) return;
            for (const auto& r : round->results) ProcessResult(r);
            if (round->done) round->done();
        });
    }
}

void HealthMonitor::CheckInstance(const balancer::InstancePtr& instance, ProbeDone done) {
    const std::string id = instance->instanceId;

    auto failed = [this, id](const std::string& error) {
        HealthCheckResult result;
        result.instanceId = id;
        result.status = HealthStatus::kUnhealthy;
        result.timestamp = std::chrono::system_clock::now();
        result.error = error;
        std::lock_guard<std::mutex> lock(mutex_);
        result.consecutiveFailures = ConsecutiveFailuresLocked(id) + 1;
        return result;
    };

    if (!instance->proxy) {
        HealthCheckResult result = failed("No proxy available");
        loop_->QueueInLoop([done, result]() { done(result); });
        return;
    }

    struct Probe {
        bool finished{false};
        network::TimerId guard{0};
    };
    auto probe = std::make_shared<Probe>();
    const auto start = std::chrono::steady_clock::now();

    probe->guard = loop_->RunAfter(options_.probeTimeoutSec, [probe, failed, done]() {
        if (probe->finished) return;
        probe->finished = true;
        done(failed("Health check timeout"));
    });

    instance->proxy->HealthCheck(options_.probeTimeoutSec,
                                 [this, probe, id, start, failed, done](const worker::ProbeResult& answer) {
        if (probe->finished) return;
        probe->finished = true;
        loop_->Cancel(probe->guard);

        if (answer.transportError) {
            done(failed(answer.error));
            return;
        }

        HealthCheckResult result;
        result.instanceId = id;
        result.timestamp = std::chrono::system_clock::now();
        result.responseTimeMs = ElapsedMs(start);
        if (answer.healthy) {
            result.status = HealthStatus::kHealthy;
            result.consecutiveFailures = 0;
        } else {
            result.status = HealthStatus::kDegraded;
            result.error = answer.error.empty() ? "Health check returned false" : answer.error;
            std::lock_guard<std::mutex> lock(mutex_);
            result.consecutiveFailures = ConsecutiveFailuresLocked(id) + 1;
        }
        done(std::move(result));
    });
}

int HealthMonitor::ConsecutiveFailuresLocked(const std::string& instanceId) const {
    auto it = history_.find(instanceId);
    if (it == history_.end()) return 0;
    int failures = 0;
    for (auto r = it->second.rbegin(); r != it->second.rend(); ++r) {
        if (r->status == HealthStatus::kHealthy) break;
        ++failures;
    }
    return failures;
}

void HealthMonitor::ProcessResult(const HealthCheckResult& result) {
    const std::string& id = result.instanceId;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& history = history_[id];
        changed = history.empty() || history.back().status != result.status;
        history.push_back(result);
        while (history.size() > options_.historyLimit) history.pop_front();
    }

    if (changed && healthChangeCb_) {
        try {
            healthChangeCb_(id, result);
        } catch (const std::exception& e) {
            LOG_ERROR << "Error in health change callback: " << e.what();
        }
    }

    if (result.status != HealthStatus::kHealthy) {
        LOG_WARN << "Instance " << id << " health: " << HealthStatusName(result.status)
                 << " (failures: " << result.consecutiveFailures << ", error: " << result.error << ")";
    }

    if (result.status == HealthStatus::kUnhealthy && result.consecutiveFailures >= options_.failureThreshold) {
        TriggerRecovery(result);
    }
}

void HealthMonitor::TriggerRecovery(const HealthCheckResult& result) {
    const std::string& id = result.instanceId;

    if (!options_.recoveryEnabled) {
        LOG_WARN << "Recovery disabled, skipping instance " << id;
        return;
    }

    balancer::InstancePtr instance = pool_->Get(id);
    if (!instance) return;

    int attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (recovering_.count(id)) return;
        attempts = recoveryAttempts_[id];

        if (attempts < options_.maxRecoveryAttempts) {
            auto last = lastRecovery_.find(id);
            if (last != lastRecovery_.end()) {
                const double minInterval = options_.backoffBaseSec * std::pow(2.0, attempts);
                const double since = std::chrono::duration<double>(std::chrono::steady_clock::now() - last->second).count();
                if (since < minInterval) {
                    LOG_DEBUG << "Skipping recovery for " << id << ", too soon after last attempt";
                    return;
                }
            }
            recovering_.insert(id);
        }
    }

    if (attempts >= options_.maxRecoveryAttempts) {
        LOG_ERROR << "Instance " << id << " exceeded max recovery attempts (" << options_.maxRecoveryAttempts
                  << "), marking as failed";
        instance->status = balancer::InstanceStatus::kFailed;
        instance->noRestart = true;
        instance->error = "Exceeded max recovery attempts";
        return;
    }

    RecoveryAction action;
    action.instanceId = id;
    action.reason = "Consecutive failures: " + std::to_string(result.consecutiveFailures) + ", error: " + result.error;
    action.timestamp = std::chrono::system_clock::now();

    if (recoveryStartCb_) {
        try {
            recoveryStartCb_(action);
        } catch (const std::exception& e) {
            LOG_ERROR << "Error in recovery start callback: " << e.what();
        }
    }

    LOG_INFO << "Starting recovery for instance " << id << " (attempt " << attempts + 1 << "/"
             << options_.maxRecoveryAttempts << ")";
    PerformRecovery(instance, [this, id, attempts](bool success, std::string message) {
        CompleteRecovery(id, attempts, success, message);
    });
}

void HealthMonitor::PerformRecovery(const balancer::InstancePtr& instance, std::function<void(bool, std::string)> done) {
    worker::WorkerProxyPtr proxy = instance->proxy;
    if (!proxy) {
        done(false, "No proxy to restart");
        return;
    }

    const balancer::InstanceStatus previous = instance->status;
    instance->status = balancer::InstanceStatus::kInitializing;
    proxy->Stop();

    // The pool may drop the instance while a restart is pending.
    auto removed = [this, instance, proxy, done]() {
        if (pool_->Get(instance->instanceId) == instance) return false;
        proxy->Stop();
        done(false, "Instance removed during recovery");
        return true;
    };

    const double recheckDelay = options_.recheckDelaySec;
    const double probeTimeout = options_.probeTimeoutSec;
    loop_->RunAfter(options_.restartPauseSec, [this, instance, proxy, previous, done, removed, recheckDelay, probeTimeout]() {
        if (removed()) return;
        proxy->Start([this, instance, proxy, previous, done, removed, recheckDelay, probeTimeout](const worker::StartResult& started) {
            if (removed()) return;
            if (!started.ok) {
                // The proxy is down; stay probeable but out of dispatch until a restart succeeds.
                instance->status = balancer::InstanceStatus::kFailed;
                instance->error = "Instance restart failed: " + started.message;
                done(false, instance->error);
                return;
            }
            loop_->RunAfter(recheckDelay, [instance, proxy, previous, done, removed, probeTimeout]() {
                if (removed()) return;
                proxy->HealthCheck(probeTimeout, [instance, previous, done, removed](const worker::ProbeResult& probe) {
                    if (removed()) return;
                    if (probe.healthy) {
                        instance->status = balancer::InstanceStatus::kActive;
                        instance->error.clear();
                        done(true, "Instance restarted successfully");
                    } else {
                        instance->status = previous;
                        done(false, "Instance restart failed health check");
                    }
                });
            });
        });
    });
}

void HealthMonitor::CompleteRecovery(const std::string& instanceId, int attempts, bool success, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recovering_.erase(instanceId);
        recoveryAttempts_[instanceId] = success ? 0 : attempts + 1;
        lastRecovery_[instanceId] = std::chrono::steady_clock::now();
    }

    if (recoveryCompleteCb_) {
        try {
            recoveryCompleteCb_(instanceId, success, message);
        } catch (const std::exception& e) {
            LOG_ERROR << "Error in recovery complete callback: " << e.what();
        }
    }

    if (success) {
        LOG_INFO << "Recovery successful for instance " << instanceId << ": " << message;
    } else {
        LOG_ERROR << "Recovery failed for instance " << instanceId << ": " << message;
    }
}

std::optional<HealthStatus> HealthMonitor::GetHealthStatus(const std::string& instanceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recovering_.count(instanceId)) return HealthStatus::kRecovering;
    auto it = history_.find(instanceId);
    if (it == history_.end() || it->second.empty()) return std::nullopt;
    return it->second.back().status;
}

bool HealthMonitor::IsRecovering(const std::string& instanceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recovering_.count(instanceId) > 0;
}

HealthMetrics HealthMonitor::MetricsLocked(const std::string& instanceId) const {
    HealthMetrics m;
    auto attempts = recoveryAttempts_.find(instanceId);
    if (attempts != recoveryAttempts_.end()) m.recoveryAttempts = attempts->second;

    auto it = history_.find(instanceId);
    if (it == history_.end() || it->second.empty()) return m;

    const auto& history = it->second;
    double totalMs = 0.0;
    int timed = 0;
    for (const auto& r : history) {
        if (r.status == HealthStatus::kHealthy) ++m.healthyCount;
        else if (r.status == HealthStatus::kUnhealthy) ++m.unhealthyCount;
        if (r.responseTimeMs) {
            totalMs += *r.responseTimeMs;
            ++timed;
        }
    }
    m.totalChecks = static_cast<int>(history.size());
    m.avgResponseTimeMs = timed > 0 ? std::round(totalMs / timed * 100.0) / 100.0 : 0.0;
    m.consecutiveFailures = history.back().consecutiveFailures;
    m.hasLastCheck = true;
    m.lastCheck = history.back().timestamp;
    m.lastStatus = history.back().status;
    return m;
}

HealthMetrics HealthMonitor::GetMetrics(const std::string& instanceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return MetricsLocked(instanceId);
}

std::map<std::string, HealthMetrics> HealthMonitor::GetAllMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, HealthMetrics> out;
    for (const auto& kv : history_) out[kv.first] = MetricsLocked(kv.first);
    return out;
}

} // namespace monitor
} // namespace wrapmgr
