#include "wrapmgr/session/LoginSessionManager.h"
#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "../support/FakeWorkerProxy.h"

#include <map>
#include <memory>
#include <string>

using namespace wrapmgr;
using balancer::InstancePool;
using session::LoginOutcome;
using session::LoginSession;
using session::LoginSessionManager;
using session::LoginState;

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    network::EventLoop loop;

    std::map<std::string, std::string> regions;
    InstancePool pool(&loop, [&](const worker::WorkerSpec& spec) {
        auto proxy = std::make_shared<testing::FakeWorkerProxy>(&loop);
        regions[spec.username] = spec.region;
        if (spec.username == "tfa@example.com") {
            if (spec.twoFactorCode.empty()) {
                proxy->startResult = {false, worker::StartError::kTwoFactorRequired, "2FA required"};
            } else if (spec.twoFactorCode != "123456") {
                proxy->startResult = {false, worker::StartError::kAuthFailed, "Bad two-factor code"};
            }
        }
        if (spec.username == "bad@example.com") {
            proxy->startResult = {false, worker::StartError::kAuthFailed, "Invalid credentials"};
        }
        return proxy;
    });

    LoginSessionManager::Options opts;
    opts.gracePeriodSec = 10.0;
    opts.defaultRegion = "us";
    LoginSessionManager sessions(&loop, &pool,
                                 [](const std::string& username) {
                                     return username == "plain@example.com" ? std::string("jp") : std::string();
                                 },
                                 opts);

    int failures = 0;
    auto check = [&](bool cond, const char* what) {
        if (!cond) {
            LOG_ERROR << "check failed: " << what;
            ++failures;
        }
    };

    int settled = 0;

    loop.RunAfter(0.01, [&]() {
        auto none = sessions.Provide2fa("nobody@example.com", "123456");
        check(!none.ok && none.outcome == LoginOutcome::kNoSession, "2fa without a session");
        check(!sessions.Watch("no-such-session", [](const LoginSession&) {}), "watch unknown session");

        // Plain password login; a second request while the first runs is refused.
        auto first = sessions.StartLogin("plain@example.com", "pw");
        check(first.ok && first.outcome == LoginOutcome::kSubmitted, "plain submitted");
        check(!first.sessionId.empty(), "session id assigned");
        auto again = sessions.StartLogin("plain@example.com", "pw");
        check(!again.ok && again.outcome == LoginOutcome::kInProgress, "duplicate login in progress");
        check(again.sessionId == first.sessionId, "same session reported");
        check(sessions.Watch(first.sessionId, [&](const LoginSession& s) {
            ++settled;
            check(s.state == LoginState::kCompleted, "plain completed");
            check(regions["plain@example.com"] == "jp", "resolved region used");
            check(pool.GetByUsername("plain@example.com") != nullptr, "instance registered");
            auto relog = sessions.StartLogin("plain@example.com", "pw");
            check(relog.outcome == LoginOutcome::kAlreadyLoggedIn, "already logged in");
        }), "watch plain");

        // Wrong credentials end in Failed with the worker's message.
        auto bad = sessions.StartLogin("bad@example.com", "nope");
        check(bad.ok, "bad submitted");
        sessions.Watch(bad.sessionId, [&](const LoginSession& s) {
            ++settled;
            check(s.state == LoginState::kFailed, "bad failed");
            check(s.error == "Invalid credentials", "bad error");
            check(regions["bad@example.com"] == "us", "default region");
        });

        // Two-factor flow.
        auto tfa = sessions.StartLogin("tfa@example.com", "pw");
        check(tfa.ok, "tfa submitted");
        sessions.Watch(tfa.sessionId, [&, tfa](const LoginSession& s) {
            ++settled;
            check(s.state == LoginState::kPending2FA, "tfa pending code");
            loop.QueueInLoop([&, tfa]() {
                auto waiting = sessions.StartLogin("tfa@example.com", "pw");
                check(waiting.outcome == LoginOutcome::kAwaitingTwoFactor, "awaiting code");
                check(waiting.sessionId == tfa.sessionId, "session kept while awaiting code");

                auto code = sessions.Provide2fa("tfa@example.com", "123456");
                check(code.ok && code.outcome == LoginOutcome::kSubmitted, "code submitted");
                auto twice = sessions.Provide2fa("tfa@example.com", "123456");
                check(twice.outcome == LoginOutcome::kInProgress, "second code while attempting");

                sessions.Watch(tfa.sessionId, [&](const LoginSession& done) {
                    ++settled;
                    check(done.state == LoginState::kCompleted, "tfa completed");
                    check(done.twoFactorCode == "123456", "code recorded");
                    loop.QueueInLoop([&]() {
                        auto late = sessions.Provide2fa("tfa@example.com", "123456");
                        check(late.outcome == LoginOutcome::kInvalidState, "code after completion");
                        check(late.message == "Invalid login state: completed", "invalid state message");
                    });
                });
            });
        });
    });

    loop.RunAfter(0.3, [&]() {
        check(settled == 4, "every watcher fired once");
        check(sessions.SessionCount() == 3, "finished sessions kept through the grace period");
        auto bySession = sessions.GetSessionByUsername("bad@example.com");
        check(bySession && sessions.GetSession(bySession->sessionId).has_value(), "lookup by username and id");

        // A finished session is replaced by a fresh login.
        auto retry = sessions.StartLogin("bad@example.com", "still-wrong");
        check(retry.ok && retry.sessionId != bySession->sessionId, "failed session replaced");
        check(sessions.SessionCount() == 3, "replaced, not added");

        // In-flight sessions are failed for their watchers when they expire.
        bool expiredSeen = false;
        sessions.Watch(retry.sessionId, [&](const LoginSession& s) {
            expiredSeen = true;
            check(s.state == LoginState::kFailed && s.error == "Login session expired", "expired session failed");
        });
        check(sessions.CleanupExpired(0.0) == 3, "all sessions expired");
        check(expiredSeen, "watcher told about expiry");
        check(sessions.SessionCount() == 0, "no session left");
        check(!sessions.GetSessionByUsername("tfa@example.com"), "username index cleared");
    });

    loop.RunAfter(0.5, [&]() { loop.Quit(); });
    loop.Loop();

    if (failures) {
        LOG_ERROR << "LoginSessionManager: FAIL";
        return 1;
    }
    LOG_INFO << "LoginSessionManager: PASS";
    return 0;
}
