#include "wrapmgr/monitor/OperationStats.h"
#include "wrapmgr/common/Logger.h"

#include <cassert>
#include <string>

using namespace wrapmgr::monitor;

int main() {
    wrapmgr::common::Logger::Instance().SetLevel(wrapmgr::common::LogLevel::INFO);
    auto& stats = OperationStats::Instance();
    stats.Reset();

    for (int i = 1; i <= 100; ++i) stats.RecordOperation("decrypt", static_cast<double>(i), i % 10 != 0);
    stats.RecordOperation("m3u8", 5.0, true);

    auto d = stats.GetOperation("decrypt");
    assert(d);
    assert(d->total == 100);
    assert(d->successes == 90);
    assert(d->failures == 10);
    assert(d->minMs == 1.0);
    assert(d->maxMs == 100.0);
    assert(d->avgMs == 50.5);
    assert(d->p50Ms == 51.0);
    assert(d->p95Ms == 96.0);
    assert(!stats.GetOperation("lyrics"));

    // The latency window keeps the newest samples only.
    for (int i = 0; i < 1500; ++i) stats.RecordOperation("window", 1000.0, true);
    for (int i = 0; i < 1000; ++i) stats.RecordOperation("window", 1.0, true);
    auto w = stats.GetOperation("window");
    assert(w && w->total == 2500);
    assert(w->p99Ms == 1.0);
    assert(w->maxMs == 1000.0);

    stats.IncCounter("recovery_started");
    stats.IncCounter("recovery_started", 2);
    assert(stats.GetCounter("recovery_started") == 3);
    assert(stats.GetCounter("never") == 0);

    stats.IncActiveStreams();
    stats.IncActiveStreams();
    stats.DecActiveStreams();
    assert(stats.GetActiveStreams() == 1);

    stats.SetGauge("instances", 2);
    {
        OperationTimer timer("status");
        timer.Finish(true);
        timer.Finish(false);
    }
    assert(stats.GetOperation("status")->total == 1);

    const std::string js = stats.ToJson();
    assert(js.find("\"decrypt\": {\"total\": 100, \"success\": 90, \"failure\": 10") != std::string::npos);
    assert(js.find("\"recovery_started\": 3") != std::string::npos);
    assert(js.find("\"instances\": 2") != std::string::npos);
    assert(js.find("\"active_streams\": 1") != std::string::npos);
    assert(js.find("\"rss_bytes\"") != std::string::npos);

    stats.Reset();
    assert(stats.GetAllOperations().empty());

    LOG_INFO << "OperationStats: PASS";
    return 0;
}
