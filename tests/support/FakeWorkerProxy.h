#pragma once

#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/worker/WorkerProxy.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace wrapmgr {
namespace testing {

// Scriptable in-process worker. Every answer is delivered on the next loop
// iteration, like a real socket round trip.
class FakeWorkerProxy : public worker::WorkerProxy {
public:
    explicit FakeWorkerProxy(network::EventLoop* loop, bool batch = false)
        : loop_(loop),
          batch_(batch) {}

    // Scripted behaviour.
    worker::StartResult startResult{true, worker::StartError::kNone, ""};
    worker::ProbeResult probe{true, false, ""};
    bool answerProbes{true};
    std::string m3u8Url{"https://example.com/master.m3u8"};
    std::string m3u8Error;
    std::string devToken{"dev-token"};
    std::string mediaToken{"media-token"};
    std::string decryptError;

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> decrypts{0};
    std::atomic<int> batches{0};
    std::atomic<int> probes{0};

    static std::string Reverse(std::string s) {
        std::reverse(s.begin(), s.end());
        return s;
    }

    void Start(StartCallback cb) override {
        ++starts;
        const worker::StartResult r = startResult;
        if (r.ok) active_ = true;
        loop_->QueueInLoop([cb, r]() { cb(r); });
    }

    void Stop() override {
        ++stops;
        active_ = false;
    }

    bool IsActive() const override { return active_; }
    bool SupportsBatch() const override { return batch_; }

    void Decrypt(const std::string&, const std::string&, std::string sample, int, DecryptCallback cb) override {
        ++decrypts;
        worker::DecryptOutcome out;
        if (!active_) {
            out.error = "Proxy not active";
        } else if (!decryptError.empty()) {
            out.error = decryptError;
        } else {
            out.ok = true;
            out.data = Reverse(sample);
        }
        loop_->QueueInLoop([cb, out]() { cb(out); });
    }

    void DecryptBatch(const std::string&, const std::string&, std::vector<std::string> samples, BatchCallback cb) override {
        ++batches;
        worker::BatchOutcome out;
        if (!active_) {
            out.error = "Proxy not active";
        } else {
            out.ok = true;
            for (auto& s : samples) out.data.push_back(Reverse(s));
        }
        loop_->QueueInLoop([cb, out]() { cb(out); });
    }

    void GetM3u8(const std::string& adamId, M3u8Callback cb) override {
        worker::M3u8Outcome out;
        if (!m3u8Error.empty()) {
            out.error = m3u8Error;
        } else {
            out.ok = true;
            out.url = m3u8Url + "?id=" + adamId;
        }
        loop_->QueueInLoop([cb, out]() { cb(out); });
    }

    void GetAccountInfo(AccountCallback cb) override {
        std::optional<worker::AccountInfo> info;
        if (!devToken.empty() && !mediaToken.empty()) {
            worker::AccountInfo a;
            a.devToken = devToken;
            a.mediaToken = mediaToken;
            info = a;
        }
        loop_->QueueInLoop([cb, info]() { cb(info); });
    }

    void HealthCheck(double, ProbeCallback cb) override {
        ++probes;
        if (!answerProbes) return;
        worker::ProbeResult p = probe;
        if (!active_) {
            p.healthy = false;
            p.transportError = true;
            p.error = "Proxy not active";
        }
        loop_->QueueInLoop([cb, p]() { cb(p); });
    }

private:
    network::EventLoop* loop_;
    bool batch_;
    bool active_{false};
};

} // namespace testing
} // namespace wrapmgr
