#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wrapmgr {
namespace monitor {

// Process-wide operation counters and latency windows, rendered as JSON for
// the periodic stats log.
class OperationStats {
public:
    static OperationStats& Instance();

    struct OperationSnapshot {
        std::string operation;
        long long total{0};
        long long successes{0};
        long long failures{0};
        double minMs{0.0};
        double avgMs{0.0};
        double maxMs{0.0};
        double p50Ms{0.0};
        double p95Ms{0.0};
        double p99Ms{0.0};
    };

    void RecordOperation(const std::string& operation, double durationMs, bool success);
    std::optional<OperationSnapshot> GetOperation(const std::string& operation) const;
    std::vector<OperationSnapshot> GetAllOperations() const;

    void IncCounter(const std::string& name, long long n = 1);
    long long GetCounter(const std::string& name) const;
    void SetGauge(const std::string& name, double value);

    void IncActiveStreams() { activeStreams_.fetch_add(1, std::memory_order_relaxed); }
    void DecActiveStreams() { activeStreams_.fetch_sub(1, std::memory_order_relaxed); }
    long GetActiveStreams() const { return activeStreams_.load(std::memory_order_relaxed); }

    std::string ToJson() const;
    void Reset();

    static constexpr size_t kWindow = 1000;

private:
    OperationStats();

    struct OperationData {
        long long total{0};
        long long successes{0};
        long long failures{0};
        double totalMs{0.0};
        double minMs{0.0};
        double maxMs{0.0};
        std::deque<double> window;
    };

    static OperationSnapshot Snapshot(const std::string& name, const OperationData& data);

    std::atomic<long> activeStreams_{0};
    std::chrono::system_clock::time_point startTime_;

    mutable std::mutex mutex_;
    std::map<std::string, OperationData> operations_;
    std::map<std::string, long long> counters_;
    std::map<std::string, double> gauges_;
};

// Measures one operation from construction to Finish().
class OperationTimer {
public:
    explicit OperationTimer(std::string operation)
        : operation_(std::move(operation)),
          start_(std::chrono::steady_clock::now()) {}

    double ElapsedMs() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    void Finish(bool success) {
        if (finished_) return;
        finished_ = true;
        OperationStats::Instance().RecordOperation(operation_, ElapsedMs(), success);
    }

private:
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
    bool finished_{false};
};

} // namespace monitor
} // namespace wrapmgr
