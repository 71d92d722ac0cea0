#pragma once

#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wrapmgr {
namespace network {
class EventLoop;
}

namespace session {

enum class LoginState {
    kPendingPassword,
    kPending2FA,
    kCompleted,
    kFailed
};

const char* LoginStateName(LoginState s);

struct LoginSession {
    std::string sessionId;
    std::string username;
    std::string password;
    LoginState state{LoginState::kPendingPassword};
    std::string twoFactorCode;
    std::chrono::steady_clock::time_point createdAt;
    std::string error;
    // An instance creation for this session is in flight.
    bool attempting{false};
};

enum class LoginOutcome {
    kSubmitted,
    kAlreadyLoggedIn,
    kAwaitingTwoFactor,
    kInProgress,
    kNoSession,
    kInvalidState
};

const char* LoginOutcomeName(LoginOutcome o);

struct LoginResult {
    bool ok{false};
    LoginOutcome outcome{LoginOutcome::kSubmitted};
    std::string message;
    std::string sessionId;
};

// Login state machine on top of InstancePool:
//   PendingPassword -> Completed
//   PendingPassword -> Pending2FA -> Completed
//   any -> Failed
// One session per username. StartLogin and Provide2fa return at once; the
// instance is created in the background and Watch() reports where it landed.
class LoginSessionManager : wrapmgr::common::noncopyable {
public:
    using RegionResolver = std::function<std::string(const std::string& username)>;
    using WatchCallback = std::function<void(const LoginSession& session)>;

    struct Options {
        double gracePeriodSec{60.0};
        std::string defaultRegion{"us"};
    };

    LoginSessionManager(network::EventLoop* loop, balancer::InstancePool* pool);
    LoginSessionManager(network::EventLoop* loop,
                        balancer::InstancePool* pool,
                        RegionResolver resolver,
                        Options options);

    LoginResult StartLogin(const std::string& username, const std::string& password);
    LoginResult Provide2fa(const std::string& username, const std::string& code);

    std::optional<LoginSession> GetSession(const std::string& sessionId) const;
    std::optional<LoginSession> GetSessionByUsername(const std::string& username) const;

    // cb fires once, from the loop, when no attempt is in flight for the
    // session any more. Returns false for an unknown session.
    bool Watch(const std::string& sessionId, WatchCallback cb);

    // Drops sessions older than maxAgeSec whatever their state. Returns the count.
    int CleanupExpired(double maxAgeSec = 600.0);

    size_t SessionCount() const;

private:
    using SessionPtr = std::shared_ptr<LoginSession>;

    void PerformLogin(const SessionPtr& session);
    void Settle(const std::string& sessionId);
    void SchedulePurge(const std::string& sessionId);
    void EraseLocked(const std::string& sessionId);
    std::string RegionFor(const std::string& username) const;

    network::EventLoop* loop_;
    balancer::InstancePool* pool_;
    RegionResolver resolver_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, SessionPtr> sessions_;
    std::map<std::string, std::string> usernameToSession_;
    std::map<std::string, std::vector<WatchCallback>> watchers_;
};

} // namespace session
} // namespace wrapmgr
