#include "wrapmgr/session/LoginSessionManager.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "wrapmgr/common/Uuid.h"

namespace wrapmgr {
namespace session {

const char* LoginStateName(LoginState s) {
    switch (s) {
        case LoginState::kPendingPassword: return "pending_password";
        case LoginState::kPending2FA: return "pending_2fa";
        case LoginState::kCompleted: return "completed";
        case LoginState::kFailed: return "failed";
    }
    return "unknown";
}

const char* LoginOutcomeName(LoginOutcome o) {
    switch (o) {
        case LoginOutcome::kSubmitted: return "submitted";
        case LoginOutcome::kAlreadyLoggedIn: return "already_logged_in";
        case LoginOutcome::kAwaitingTwoFactor: return "awaiting_two_factor";
        case LoginOutcome::kInProgress: return "in_progress";
        case LoginOutcome::kNoSession: return "no_session";
        case LoginOutcome::kInvalidState: return "invalid_state";
    }
    return "unknown";
}

LoginSessionManager::LoginSessionManager(network::EventLoop* loop, balancer::InstancePool* pool)
    : LoginSessionManager(loop, pool, nullptr, Options()) {
}

LoginSessionManager::LoginSessionManager(network::EventLoop* loop,
                                         balancer::InstancePool* pool,
                                         RegionResolver resolver,
                                         Options options)
    : loop_(loop),
      pool_(pool),
      resolver_(std::move(resolver)),
      options_(std::move(options)) {
}

std::string LoginSessionManager::RegionFor(const std::string& username) const {
    std::string region = resolver_ ? resolver_(username) : std::string();
    return region.empty() ? options_.defaultRegion : region;
}

LoginResult LoginSessionManager::StartLogin(const std::string& username, const std::string& password) {
    LoginResult result;

    if (pool_->GetByUsername(username)) {
        result.outcome = LoginOutcome::kAlreadyLoggedIn;
        result.message = "Account " + username + " is already logged in";
        return result;
    }

    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto nameIt = usernameToSession_.find(username);
        if (nameIt != usernameToSession_.end()) {
            auto it = sessions_.find(nameIt->second);
            if (it != sessions_.end()) {
                const LoginSession& existing = *it->second;
                if (existing.state == LoginState::kPending2FA && !existing.attempting) {
                    result.outcome = LoginOutcome::kAwaitingTwoFactor;
                    result.message = "Waiting for two-factor code";
                    result.sessionId = existing.sessionId;
                    return result;
                }
                if (existing.attempting) {
                    result.outcome = LoginOutcome::kInProgress;
                    result.message = "Login already in progress";
                    result.sessionId = existing.sessionId;
                    return result;
                }
                // A finished session still inside its grace period is replaced.
                EraseLocked(existing.sessionId);
            }
        }

        const std::string sessionId = common::Uuid4();
        if (sessionId.empty()) {
            result.outcome = LoginOutcome::kInvalidState;
            result.message = "Cannot create login session";
            return result;
        }

        session = std::make_shared<LoginSession>();
        session->sessionId = sessionId;
        session->username = username;
        session->password = password;
        session->createdAt = std::chrono::steady_clock::now();
        session->attempting = true;
        sessions_[sessionId] = session;
        usernameToSession_[username] = sessionId;
    }

    LOG_INFO << "Started login session for " << username;
    PerformLogin(session);

    result.ok = true;
    result.outcome = LoginOutcome::kSubmitted;
    result.message = "Login request submitted";
    result.sessionId = session->sessionId;
    return result;
}

LoginResult LoginSessionManager::Provide2fa(const std::string& username, const std::string& code) {
    LoginResult result;
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto nameIt = usernameToSession_.find(username);
        if (nameIt == usernameToSession_.end()) {
            result.outcome = LoginOutcome::kNoSession;
            result.message = "No login session found";
            return result;
        }
        auto it = sessions_.find(nameIt->second);
        if (it == sessions_.end()) {
            result.outcome = LoginOutcome::kNoSession;
            result.message = "Login session is invalid";
            return result;
        }
        session = it->second;
        result.sessionId = session->sessionId;

        if (session->attempting) {
            result.outcome = LoginOutcome::kInProgress;
            result.message = "Login already in progress";
            return result;
        }
        if (session->state != LoginState::kPending2FA) {
            result.outcome = LoginOutcome::kInvalidState;
            result.message = std::string("Invalid login state: ") + LoginStateName(session->state);
            return result;
        }

        session->twoFactorCode = code;
        session->attempting = true;
    }

    LOG_INFO << "Received 2FA code for " << username;
    PerformLogin(session);

    result.ok = true;
    result.outcome = LoginOutcome::kSubmitted;
    result.message = "Two-factor code submitted";
    return result;
}

void LoginSessionManager::PerformLogin(const SessionPtr& session) {
    const std::string sessionId = session->sessionId;
    const std::string username = session->username;
    std::string password;
    std::string code;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        password = session->password;
        code = session->twoFactorCode;
    }

    pool_->Add(username, password, RegionFor(username), code,
               [this, sessionId, username](const balancer::InstancePool::AddResult& added) {
        bool terminal = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(sessionId);
            if (it == sessions_.end()) {
                LOG_WARN << "Login session for " << username << " expired before the login finished";
                return;
            }
            LoginSession& s = *it->second;
            s.attempting = false;
            if (added.ok) {
                s.state = LoginState::kCompleted;
                s.error.clear();
                terminal = true;
            } else if (added.failure == balancer::InstancePool::AddFailure::kTwoFactorRequired &&
                       s.twoFactorCode.empty()) {
                s.state = LoginState::kPending2FA;
            } else {
                s.state = LoginState::kFailed;
                s.error = added.message;
                terminal = true;
            }
        }

        if (added.ok) {
            LOG_INFO << "Login completed for " << username;
        } else if (!terminal) {
            LOG_INFO << "2FA required for " << username;
        } else {
            LOG_ERROR << "Login failed for " << username << ": " << added.message;
        }

        if (terminal) SchedulePurge(sessionId);
        Settle(sessionId);
    });
}

void LoginSessionManager::Settle(const std::string& sessionId) {
    std::vector<WatchCallback> callbacks;
    LoginSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto w = watchers_.find(sessionId);
        if (w == watchers_.end()) return;
        callbacks.swap(w->second);
        watchers_.erase(w);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return;
        snapshot = *it->second;
    }
    for (auto& cb : callbacks) cb(snapshot);
}

void LoginSessionManager::SchedulePurge(const std::string& sessionId) {
    loop_->RunAfter(options_.gracePeriodSec, [this, sessionId]() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return;
        const LoginState state = it->second->state;
        if (state == LoginState::kCompleted || state == LoginState::kFailed) EraseLocked(sessionId);
    });
}

void LoginSessionManager::EraseLocked(const std::string& sessionId) {
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) return;
    auto nameIt = usernameToSession_.find(it->second->username);
    if (nameIt != usernameToSession_.end() && nameIt->second == sessionId) usernameToSession_.erase(nameIt);
    sessions_.erase(it);
}

bool LoginSessionManager::Watch(const std::string& sessionId, WatchCallback cb) {
    LoginSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        if (it->second->attempting) {
            watchers_[sessionId].push_back(std::move(cb));
            return true;
        }
        snapshot = *it->second;
    }
    loop_->QueueInLoop([cb, snapshot]() { cb(snapshot); });
    return true;
}

std::optional<LoginSession> LoginSessionManager::GetSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) return std::nullopt;
    return *it->second;
}

std::optional<LoginSession> LoginSessionManager::GetSessionByUsername(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto nameIt = usernameToSession_.find(username);
    if (nameIt == usernameToSession_.end()) return std::nullopt;
    auto it = sessions_.find(nameIt->second);
    if (it == sessions_.end()) return std::nullopt;
    return *it->second;
}

int LoginSessionManager::CleanupExpired(double maxAgeSec) {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<LoginSession, std::vector<WatchCallback>>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& kv : sessions_) {
            const double age = std::chrono::duration<double>(now - kv.second->createdAt).count();
            if (age > maxAgeSec) ids.push_back(kv.first);
        }
        for (const auto& id : ids) {
            LoginSession snapshot = *sessions_[id];
            LOG_INFO << "Cleaning up expired session: " << snapshot.username;
            if (snapshot.state != LoginState::kCompleted) {
                snapshot.state = LoginState::kFailed;
                snapshot.error = "Login session expired";
            }
            std::vector<WatchCallback> callbacks;
            auto w = watchers_.find(id);
            if (w != watchers_.end()) {
                callbacks.swap(w->second);
                watchers_.erase(w);
            }
            EraseLocked(id);
            expired.emplace_back(std::move(snapshot), std::move(callbacks));
        }
    }

    for (auto& e : expired) {
        for (auto& cb : e.second) cb(e.first);
    }
    return static_cast<int>(expired.size());
}

size_t LoginSessionManager::SessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace session
} // namespace wrapmgr
