#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "../support/FakeWorkerProxy.h"

#include <map>
#include <memory>
#include <vector>

using namespace wrapmgr;
using balancer::InstancePool;

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    network::EventLoop loop;

    std::map<std::string, std::shared_ptr<testing::FakeWorkerProxy>> proxies;
    InstancePool pool(&loop, [&](const worker::WorkerSpec& spec) {
        auto proxy = std::make_shared<testing::FakeWorkerProxy>(&loop);
        if (spec.username == "needs2fa@example.com" && spec.twoFactorCode.empty()) {
            proxy->startResult = {false, worker::StartError::kTwoFactorRequired, "2FA required"};
        }
        if (spec.username == "broken@example.com") {
            proxy->startResult = {false, worker::StartError::kUnavailable, "HTTP 500"};
        }
        proxies[spec.username] = proxy;
        return proxy;
    });

    int failures = 0;
    auto check = [&](bool cond, const char* what) {
        if (!cond) {
            LOG_ERROR << "check failed: " << what;
            ++failures;
        }
    };

    std::vector<InstancePool::AddResult> results;
    std::map<std::string, bool> health;
    auto collect = [&](const InstancePool::AddResult& r) { results.push_back(r); };

    // Two adds racing for the same account: exactly one wins.
    pool.Add("alice@example.com", "pw", "us", "", collect);
    pool.Add("alice@example.com", "pw", "us", "", collect);
    pool.Add("needs2fa@example.com", "pw", "jp", "", collect);
    pool.Add("broken@example.com", "pw", "gb", "", collect);

    loop.RunAfter(0.1, [&]() {
        check(results.size() == 4, "four add results");
        int ok = 0;
        int exists = 0;
        for (const auto& r : results) {
            if (r.ok) ++ok;
            if (r.failure == InstancePool::AddFailure::kAlreadyExists) {
                ++exists;
                check(r.message == "Account alice@example.com already exists", "duplicate message");
            }
            if (r.failure == InstancePool::AddFailure::kTwoFactorRequired) {
                check(r.message == "Failed to add account: 2FA required", "2fa message");
            }
        }
        check(ok == 1 && exists == 1, "one add wins, one duplicate");
        check(pool.Size() == 1, "pool holds one instance");
        check(pool.ClientCount() == 1, "one active client");
        check(proxies.size() == 3, "duplicate never builds a proxy");

        auto inst = pool.GetByUsername("alice@example.com");
        check(inst != nullptr, "lookup by username");
        check(inst && inst->instanceId == InstancePool::MakeInstanceId("alice@example.com"), "deterministic id");
        check(pool.Get(InstancePool::MakeInstanceId("alice@example.com")) == inst, "lookup by id");
        check(pool.Regions() == std::set<std::string>{"us"}, "regions");

        // Adding again after it settled: same id, still "already exists".
        results.clear();
        pool.Add("alice@example.com", "pw", "us", "", collect);
        pool.Add("needs2fa@example.com", "pw", "jp", "123456", collect);
    });

    loop.RunAfter(0.2, [&]() {
        check(results.size() == 2, "second round results");
        for (const auto& r : results) {
            if (r.failure == InstancePool::AddFailure::kAlreadyExists) {
                check(r.instance && r.instance->instanceId == InstancePool::MakeInstanceId("alice@example.com"),
                      "duplicate reports existing instance");
            } else {
                check(r.ok, "2fa code lets the add succeed");
            }
        }
        check(pool.Size() == 2, "two instances");
        check(pool.Regions().size() == 2, "regions of both");

        proxies["needs2fa@example.com"]->probe = {false, false, "not logged in"};
        pool.HealthCheckAll(1.0, [&](std::map<std::string, bool> m) { health = std::move(m); });
    });

    loop.RunAfter(0.3, [&]() {
        check(health.size() == 2, "health map complete");
        check(health[InstancePool::MakeInstanceId("alice@example.com")], "alice healthy");
        check(!health[InstancePool::MakeInstanceId("needs2fa@example.com")], "2fa account unhealthy");
    });

    loop.RunAfter(0.4, [&]() {
        std::string message;
        check(!pool.Remove("nope", &message), "unknown remove fails");
        check(message == "Instance not found", "unknown remove message");

        auto inst = pool.GetByUsername("alice@example.com");
        check(pool.Remove(inst->instanceId, &message), "remove");
        check(message == "Account alice@example.com removed", "remove message");
        check(inst->status == balancer::InstanceStatus::kStopped, "removed instance stopped");
        check(proxies["alice@example.com"]->stops >= 1, "proxy stopped");
        check(!pool.GetByUsername("alice@example.com"), "username index cleared");

        // Idle cleanup spares noRestart instances.
        auto other = pool.GetByUsername("needs2fa@example.com");
        other->noRestart = true;
        check(pool.CleanupIdle(0.0) == 0, "noRestart kept");
        other->noRestart = false;
        check(pool.CleanupIdle(3600.0) == 0, "recent instance kept");
        check(pool.CleanupIdle(0.0) == 1, "idle instance removed");
        check(pool.Size() == 0, "pool empty");

        pool.Add("late@example.com", "pw", "us", "", collect);
        pool.ShutdownAll();
    });

    loop.RunAfter(0.5, [&]() {
        check(pool.Size() == 0, "add racing shutdown is dropped");
        check(proxies["late@example.com"]->stops >= 1, "late proxy stopped");
        loop.Quit();
    });

    loop.Loop();

    if (failures) {
        LOG_ERROR << "InstancePool: FAIL";
        return 1;
    }
    LOG_INFO << "InstancePool: PASS";
    return 0;
}
