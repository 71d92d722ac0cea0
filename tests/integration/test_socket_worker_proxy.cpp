#include "wrapmgr/worker/SocketWorkerProxy.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "../support/FakeWorker.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace wrapmgr;
using worker::SocketWorkerProxy;

namespace {

// A loopback port nothing listens on.
uint16_t ClosedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof addr);
    socklen_t len = sizeof addr;
    ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

} // namespace

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    network::EventLoop loop;
    testing::FakeWorker fake(&loop);

    int failures = 0;
    auto check = [&](bool cond, const char* what) {
        if (!cond) {
            LOG_ERROR << "check failed: " << what;
            ++failures;
        }
    };

    auto proxy = std::make_shared<SocketWorkerProxy>(&loop, "inst-1", fake.Endpoint());

    using Step = std::function<void(std::function<void()>)>;
    std::vector<Step> steps;

    steps.push_back([&](std::function<void()> next) {
        proxy->Start([&, next](const worker::StartResult& r) {
            check(r.ok, "start verified through the account port");
            check(proxy->IsActive(), "active after start");
            check(fake.accountRequests == 1, "one account probe on start");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->DecryptBatch("1440818839", "skd://itunes.apple.com/P000000000/s1/e1", {"abc", "defg"},
                            [&, next](worker::BatchOutcome out) {
            check(out.ok, "batch decrypt");
            check(out.data == std::vector<std::string>({"cba", "gfed"}), "batch results in order");
            check(fake.lastHandshakeAdamId() == "1440818839", "handshake carried adam id");
            check(fake.decryptConnections == 1, "batch shares one connection");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->Decrypt("1440818839", "skd://k", "hello", 3, [&, next](worker::DecryptOutcome out) {
            check(out.ok && out.data == "olleh", "single decrypt");
            check(fake.decryptConnections == 2, "single decrypt on its own connection");
            next();
        });
    });

    // Worker closes in the middle of a reply.
    steps.push_back([&](std::function<void()> next) {
        fake.SetDecryptMode(testing::FakeWorker::DecryptMode::kTruncate);
        proxy->Decrypt("1440818839", "skd://k", "abcdef", 0, [&, next](worker::DecryptOutcome out) {
            check(!out.ok, "truncated reply fails");
            check(out.error == "Incomplete read (got 3/6 bytes)", "incomplete read error");
            check(proxy->IsActive(), "a failed call leaves the proxy running");
            next();
        });
    });

    // Worker takes the sample and never answers.
    worker::WorkerEndpoint quick = fake.Endpoint();
    quick.callTimeoutSec = 0.3;
    auto stalled = std::make_shared<SocketWorkerProxy>(&loop, "inst-4", quick);
    steps.push_back([&](std::function<void()> next) {
        fake.SetDecryptMode(testing::FakeWorker::DecryptMode::kStall);
        stalled->Start([&, next](const worker::StartResult& r) {
            check(r.ok, "start before stall");
            stalled->Decrypt("1440818839", "skd://k", "abcdef", 0, [&, next](worker::DecryptOutcome out) {
                check(!out.ok && out.error == "Socket timeout", "stalled worker times out");
                fake.SetDecryptMode(testing::FakeWorker::DecryptMode::kReverse);
                next();
            });
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->GetM3u8("42", [&, next](worker::M3u8Outcome out) {
            check(out.ok && out.url == "https://example.com/42/master.m3u8", "m3u8 url");
            fake.SetM3u8Line("");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->GetM3u8("42", [&, next](worker::M3u8Outcome out) {
            check(!out.ok && out.error == "Failed to get M3U8 URL", "empty m3u8 line");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->GetAccountInfo([&, next](std::optional<worker::AccountInfo> info) {
            check(info.has_value(), "account info");
            if (info) {
                check(info->devToken == "dev-1" && info->mediaToken == "media-1", "tokens");
                check(info->storefront == "us", "storefront");
            }
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->HealthCheck(1.0, [&, next](const worker::ProbeResult& p) {
            check(p.healthy && !p.transportError, "healthy probe");
            fake.SetAccountReply(500, "{}");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->HealthCheck(1.0, [&, next](const worker::ProbeResult& p) {
            check(!p.healthy && !p.transportError, "answered but unhealthy");
            check(p.error == "HTTP 500", "probe error");
            next();
        });
    });

    // Account needs a second factor.
    auto second = std::make_shared<SocketWorkerProxy>(&loop, "inst-2", fake.Endpoint());
    steps.push_back([&](std::function<void()> next) {
        fake.SetAccountReply(401, "{\"two_factor_required\": true}");
        second->Start([&, next](const worker::StartResult& r) {
            check(!r.ok && r.reason == worker::StartError::kTwoFactorRequired, "2fa required");
            check(!second->IsActive(), "inactive after failed start");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        fake.SetAccountReply(403, "{\"error\": \"bad password\"}");
        second->Start([&, next](const worker::StartResult& r) {
            check(!r.ok && r.reason == worker::StartError::kAuthFailed, "auth failed");
            next();
        });
    });

    // Nothing listening.
    worker::WorkerEndpoint closed = fake.Endpoint();
    const uint16_t port = ClosedPort();
    closed.decryptPort = port;
    closed.m3u8Port = port;
    closed.accountPort = port;
    closed.m3u8RetryDelaySec = 0.01;
    auto refused = std::make_shared<SocketWorkerProxy>(&loop, "inst-3", closed);
    steps.push_back([&](std::function<void()> next) {
        refused->Start([&, next](const worker::StartResult& r) {
            check(!r.ok && r.reason == worker::StartError::kUnavailable, "refused start unavailable");
            check(r.message == "Connection refused", "refused message");
            next();
        });
    });

    steps.push_back([&](std::function<void()> next) {
        proxy->Stop();
        check(!proxy->IsActive(), "inactive after stop");
        proxy->Decrypt("1", "k", "x", 0, [&, next](worker::DecryptOutcome out) {
            check(!out.ok && out.error == "Proxy not active", "decrypt after stop");
            proxy->HealthCheck(1.0, [&, next](const worker::ProbeResult& p) {
                check(p.transportError, "probe after stop is a transport error");
                next();
            });
        });
    });

    std::function<void(size_t)> run = [&](size_t i) {
        if (i == steps.size()) {
            loop.Quit();
            return;
        }
        steps[i]([&, i]() { run(i + 1); });
    };
    loop.RunAfter(0.01, [&]() { run(0); });
    loop.RunAfter(10.0, [&]() {
        check(false, "timed out");
        loop.Quit();
    });
    loop.Loop();

    if (failures) {
        LOG_ERROR << "SocketWorkerProxy: FAIL";
        return 1;
    }
    LOG_INFO << "SocketWorkerProxy: PASS";
    return 0;
}
