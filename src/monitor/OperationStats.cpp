#include "wrapmgr/monitor/OperationStats.h"
#include "wrapmgr/common/JsonLite.h"

#include <dirent.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace wrapmgr {
namespace monitor {

OperationStats& OperationStats::Instance() {
    static OperationStats instance;
    return instance;
}

OperationStats::OperationStats() {
    startTime_ = std::chrono::system_clock::now();
}

void OperationStats::RecordOperation(const std::string& operation, double durationMs, bool success) {
    if (durationMs < 0.0) durationMs = 0.0;
    std::lock_guard<std::mutex> lock(mutex_);
    OperationData& d = operations_[operation];
    if (d.total == 0) {
        d.minMs = durationMs;
        d.maxMs = durationMs;
    } else {
        d.minMs = std::min(d.minMs, durationMs);
        d.maxMs = std::max(d.maxMs, durationMs);
    }
    d.total += 1;
    if (success) d.successes += 1;
    else d.failures += 1;
    d.totalMs += durationMs;
    d.window.push_back(durationMs);
    if (d.window.size() > kWindow) d.window.pop_front();
}

OperationStats::OperationSnapshot OperationStats::Snapshot(const std::string& name, const OperationData& data) {
    OperationSnapshot s;
    s.operation = name;
    s.total = data.total;
    s.successes = data.successes;
    s.failures = data.failures;
    s.minMs = data.minMs;
    s.maxMs = data.maxMs;
    s.avgMs = data.total > 0 ? data.totalMs / static_cast<double>(data.total) : 0.0;

    std::vector<double> lat(data.window.begin(), data.window.end());
    if (!lat.empty()) {
        std::sort(lat.begin(), lat.end());
        auto pct = [&](double p) {
            size_t idx = static_cast<size_t>(p * static_cast<double>(lat.size()));
            if (idx >= lat.size()) idx = lat.size() - 1;
            return lat[idx];
        };
        s.p50Ms = pct(0.50);
        s.p95Ms = pct(0.95);
        s.p99Ms = pct(0.99);
    }
    return s;
}

std::optional<OperationStats::OperationSnapshot> OperationStats::GetOperation(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation);
    if (it == operations_.end()) return std::nullopt;
    return Snapshot(it->first, it->second);
}

std::vector<OperationStats::OperationSnapshot> OperationStats::GetAllOperations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OperationSnapshot> out;
    out.reserve(operations_.size());
    for (const auto& kv : operations_) out.push_back(Snapshot(kv.first, kv.second));
    return out;
}

void OperationStats::IncCounter(const std::string& name, long long n) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += n;
}

long long OperationStats::GetCounter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

void OperationStats::SetGauge(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[name] = value;
}

void OperationStats::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    operations_.clear();
    counters_.clear();
    gauges_.clear();
    activeStreams_.store(0, std::memory_order_relaxed);
    startTime_ = std::chrono::system_clock::now();
}

static long long ReadRssBytes() {
    std::ifstream f("/proc/self/status");
    if (!f.is_open()) return 0;
    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            // VmRSS:   12345 kB
            std::istringstream iss(line);
            std::string key;
            long long kb = 0;
            iss >> key >> kb;
            return kb * 1024;
        }
    }
    return 0;
}

static int ReadFdCount() {
    int count = 0;
    DIR* d = ::opendir("/proc/self/fd");
    if (!d) return 0;
    while (dirent* e = ::readdir(d)) {
        if (e->d_name[0] == '.') continue;
        count += 1;
    }
    ::closedir(d);
    return count;
}

std::string OperationStats::ToJson() const {
    const auto now = std::chrono::system_clock::now();
    std::vector<OperationSnapshot> ops = GetAllOperations();

    std::map<std::string, long long> counters;
    std::map<std::string, double> gauges;
    std::chrono::system_clock::time_point started;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters = counters_;
        gauges = gauges_;
        started = startTime_;
    }
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started).count();

    std::stringstream ss;
    ss << "{\n";
    ss << "  \"uptime_sec\": " << uptime << ",\n";
    ss << "  \"active_streams\": " << GetActiveStreams() << ",\n";

    ss << "  \"operations\": {";
    bool first = true;
    for (const auto& op : ops) {
        ss << (first ? "\n" : ",\n");
        first = false;
        ss << "    \"" << common::json::Escape(op.operation) << "\": {"
           << "\"total\": " << op.total
           << ", \"success\": " << op.successes
           << ", \"failure\": " << op.failures
           << std::fixed << std::setprecision(2)
           << ", \"min_ms\": " << op.minMs
           << ", \"avg_ms\": " << op.avgMs
           << ", \"max_ms\": " << op.maxMs
           << ", \"p50_ms\": " << op.p50Ms
           << ", \"p95_ms\": " << op.p95Ms
           << ", \"p99_ms\": " << op.p99Ms
           << "}";
        ss.unsetf(std::ios::fixed);
        ss << std::setprecision(6);
    }
    ss << (ops.empty() ? "},\n" : "\n  },\n");

    ss << "  \"counters\": {";
    first = true;
    for (const auto& kv : counters) {
        ss << (first ? "" : ", ") << "\"" << common::json::Escape(kv.first) << "\": " << kv.second;
        first = false;
    }
    ss << "},\n";

    ss << "  \"gauges\": {";
    first = true;
    for (const auto& kv : gauges) {
        ss << (first ? "" : ", ") << "\"" << common::json::Escape(kv.first) << "\": " << kv.second;
        first = false;
    }
    ss << "},\n";

    ss << "  \"process\": {\"rss_bytes\": " << ReadRssBytes() << ", \"fd_count\": " << ReadFdCount() << "}\n";
    ss << "}";
    return ss.str();
}

} // namespace monitor
} // namespace wrapmgr
