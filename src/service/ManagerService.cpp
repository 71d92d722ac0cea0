#include "wrapmgr/service/ManagerService.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/monitor/OperationStats.h"
#include "wrapmgr/common/Logger.h"

#include <google/protobuf/empty.pb.h>
#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/status.h>

#include <cctype>
#include <memory>

namespace wrapmgr {
namespace service {

const char kStatusMethod[] = "/manager.WrapperManagerService/Status";
const char kLoginMethod[] = "/manager.WrapperManagerService/Login";
const char kLogoutMethod[] = "/manager.WrapperManagerService/Logout";
const char kDecryptMethod[] = "/manager.WrapperManagerService/Decrypt";
const char kM3u8Method[] = "/manager.WrapperManagerService/M3U8";
const char kLyricsMethod[] = "/manager.WrapperManagerService/Lyrics";
const char kLicenseMethod[] = "/manager.WrapperManagerService/License";
const char kWebPlaybackMethod[] = "/manager.WrapperManagerService/WebPlayback";

const char kKeepaliveAdamId[] = "KEEPALIVE";

namespace {

const char kSuccess[] = "SUCCESS";
const char kNoInstance[] = "no available instance";

void SetHeader(manager::ReplyHeader* header, int code, const std::string& msg) {
    header->set_code(code);
    header->set_msg(msg);
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Shared plumbing for every method: one frame in flight at a time, decoded on
// the gRPC thread, answered with Reply(). Unary calls finish with their single
// reply; streams go back to reading until the client half-closes.
class CallReactor : public grpc::ServerGenericBidiReactor {
public:
    void OnReadDone(bool ok) override {
        if (!ok) {
            // Client half-closed. Nothing is in flight because reads are serial.
            FinishOnce(streaming_ ? grpc::Status::OK
                                  : grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "missing request"));
            return;
        }
        timer_.reset(new monitor::OperationTimer(operation_));
        OnFrame();
    }

    void OnWriteDone(bool ok) override {
        if (!ok) {
            FinishOnce(grpc::Status(grpc::StatusCode::CANCELLED, "write failed"));
            return;
        }
        if (streaming_) StartRead(&in_);
    }

    void OnCancel() override {
        LOG_DEBUG << "[" << operation_ << "] call cancelled by client";
    }

    void OnDone() override {
        if (streaming_) monitor::OperationStats::Instance().DecActiveStreams();
        delete this;
    }

protected:
    CallReactor(ManagerService* service, std::string operation, bool streaming)
        : service_(service),
          operation_(std::move(operation)),
          streaming_(streaming) {
        if (streaming_) monitor::OperationStats::Instance().IncActiveStreams();
    }

    void Begin() { StartRead(&in_); }

    virtual void OnFrame() = 0;

    template <typename Message>
    bool Decode(Message* msg) {
        grpc::Status st = grpc::SerializationTraits<Message>::Deserialize(&in_, msg);
        if (st.ok()) return true;
        LOG_WARN << "[" << operation_ << "] undecodable frame: " << st.error_message();
        if (timer_) timer_->Finish(false);
        FinishOnce(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "cannot parse " + Message::descriptor()->full_name()));
        return false;
    }

    template <typename Message>
    void Reply(const Message& msg, bool success) {
        if (timer_) timer_->Finish(success);
        bool own = false;
        grpc::Status st = grpc::SerializationTraits<Message>::Serialize(msg, &out_, &own);
        if (!st.ok()) {
            LOG_ERROR << "[" << operation_ << "] cannot serialize reply: " << st.error_message();
            FinishOnce(grpc::Status(grpc::StatusCode::INTERNAL, "cannot serialize reply"));
            return;
        }
        if (streaming_) {
            StartWrite(&out_);
        } else {
            finished_ = true;
            StartWriteAndFinish(&out_, grpc::WriteOptions(), grpc::Status::OK);
        }
    }

    void Post(network::EventLoop::Functor fn) { service_->loop()->QueueInLoop(std::move(fn)); }

    void FinishOnce(const grpc::Status& status) {
        if (finished_) return;
        finished_ = true;
        Finish(status);
    }

    ManagerService* service_;

private:
    std::string operation_;
    bool streaming_;
    bool finished_{false};
    grpc::ByteBuffer in_;
    grpc::ByteBuffer out_;
    std::unique_ptr<monitor::OperationTimer> timer_;
};

class StatusReactor : public CallReactor {
public:
    explicit StatusReactor(ManagerService* service) : CallReactor(service, "status", false) { Begin(); }

private:
    void OnFrame() override {
        google::protobuf::Empty request;
        if (!Decode(&request)) return;
        Post([this]() { Reply(service_->HandleStatus(), true); });
    }
};

class LoginReactor : public CallReactor {
public:
    explicit LoginReactor(ManagerService* service) : CallReactor(service, "login", true) { Begin(); }

private:
    void OnFrame() override {
        auto request = std::make_shared<manager::LoginRequest>();
        if (!Decode(request.get())) return;
        Post([this, request]() {
            service_->HandleLogin(*request, [this](manager::LoginReply reply) {
                Reply(reply, reply.header().code() != -1);
            });
        });
    }
};

class LogoutReactor : public CallReactor {
public:
    explicit LogoutReactor(ManagerService* service) : CallReactor(service, "logout", false) { Begin(); }

private:
    void OnFrame() override {
        auto request = std::make_shared<manager::LogoutRequest>();
        if (!Decode(request.get())) return;
        Post([this, request]() {
            manager::LogoutReply reply = service_->HandleLogout(*request);
            Reply(reply, reply.header().code() == 0);
        });
    }
};

class DecryptReactor : public CallReactor {
public:
    explicit DecryptReactor(ManagerService* service) : CallReactor(service, "decrypt", true) { Begin(); }

private:
    void OnFrame() override {
        auto request = std::make_shared<manager::DecryptRequest>();
        if (!Decode(request.get())) return;
        if (request->data().adam_id() == kKeepaliveAdamId) {
            Reply(ManagerService::KeepaliveReply(*request), true);
            return;
        }
        Post([this, request]() {
            service_->HandleDecrypt(*request, [this](manager::DecryptReply reply) {
                Reply(reply, reply.header().code() == 0);
            });
        });
    }
};

class M3u8Reactor : public CallReactor {
public:
    explicit M3u8Reactor(ManagerService* service) : CallReactor(service, "m3u8", false) { Begin(); }

private:
    void OnFrame() override {
        auto request = std::make_shared<manager::M3U8Request>();
        if (!Decode(request.get())) return;
        Post([this, request]() {
            service_->HandleM3u8(*request, [this](manager::M3U8Reply reply) {
                Reply(reply, reply.header().code() == 0);
            });
        });
    }
};

class LyricsReactor : public CallReactor {
public:
    explicit LyricsReactor(ManagerService* service) : CallReactor(service, "lyrics", false) { Begin(); }

private:
    void OnFrame() override {
        auto request = std::make_shared<manager::LyricsRequest>();
        if (!Decode(request.get())) return;
        Post([this, request]() {
            service_->HandleLyrics(*request, [this](manager::LyricsReply reply) {
                Reply(reply, reply.header().code() == 0);
            });
        });
    }
};

class RejectReactor : public grpc::ServerGenericBidiReactor {
public:
    explicit RejectReactor(grpc::Status status) { Finish(status); }
    void OnDone() override { delete this; }
};

} // namespace

ManagerService::ManagerService(network::EventLoop* loop,
                               balancer::InstancePool* pool,
                               balancer::Dispatcher* dispatcher,
                               session::LoginSessionManager* sessions,
                               catalog::CatalogClient* catalog)
    : loop_(loop),
      pool_(pool),
      dispatcher_(dispatcher),
      sessions_(sessions),
      catalog_(catalog) {
}

grpc::ServerGenericBidiReactor* ManagerService::CreateReactor(grpc::GenericCallbackServerContext* ctx) {
    const std::string& method = ctx->method();
    if (method == kDecryptMethod) return new DecryptReactor(this);
    if (method == kStatusMethod) return new StatusReactor(this);
    if (method == kLoginMethod) return new LoginReactor(this);
    if (method == kLogoutMethod) return new LogoutReactor(this);
    if (method == kM3u8Method) return new M3u8Reactor(this);
    if (method == kLyricsMethod) return new LyricsReactor(this);
    if (method == kLicenseMethod) {
        return new RejectReactor(grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "License not implemented"));
    }
    if (method == kWebPlaybackMethod) {
        return new RejectReactor(grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "WebPlayback not implemented"));
    }
    LOG_WARN << "Unknown method: " << method;
    return new RejectReactor(grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "Unknown method " + method));
}

manager::StatusReply ManagerService::HandleStatus() const {
    manager::StatusReply reply;
    const int clients = pool_->ClientCount();
    SetHeader(reply.mutable_header(), 0, kSuccess);
    manager::StatusData* data = reply.mutable_data();
    data->set_status(clients > 0);
    for (const auto& region : pool_->Regions()) data->add_regions(region);
    data->set_client_count(clients);
    data->set_ready(ready());
    return reply;
}

void ManagerService::HandleLogin(const manager::LoginRequest& request, ReplyCallback<manager::LoginReply> cb) {
    const manager::LoginData& data = request.data();
    const std::string username = data.username();

    auto fail = [&](const std::string& msg) {
        manager::LoginReply reply;
        SetHeader(reply.mutable_header(), -1, msg);
        reply.mutable_data()->set_username(username);
        cb(reply);
    };

    if (username.empty()) {
        fail("username is required");
        return;
    }

    session::LoginResult result;
    if (!data.two_step_code().empty()) {
        result = sessions_->Provide2fa(username, data.two_step_code());
    } else {
        result = sessions_->StartLogin(username, data.password());
    }

    switch (result.outcome) {
        case session::LoginOutcome::kSubmitted:
        case session::LoginOutcome::kInProgress:
            AnswerLogin(username, result.sessionId, std::move(cb));
            return;
        case session::LoginOutcome::kAwaitingTwoFactor: {
            manager::LoginReply reply;
            SetHeader(reply.mutable_header(), 2, result.message);
            reply.mutable_data()->set_username(username);
            cb(reply);
            return;
        }
        case session::LoginOutcome::kAlreadyLoggedIn:
        case session::LoginOutcome::kNoSession:
        case session::LoginOutcome::kInvalidState:
            break;
    }
    fail(result.message);
}

void ManagerService::AnswerLogin(const std::string& username,
                                 const std::string& sessionId,
                                 ReplyCallback<manager::LoginReply> cb) {
    const bool watching = sessions_->Watch(sessionId, [username, cb](const session::LoginSession& s) {
        manager::LoginReply reply;
        reply.mutable_data()->set_username(username);
        switch (s.state) {
            case session::LoginState::kCompleted:
                SetHeader(reply.mutable_header(), 0, "Account " + username + " logged in");
                break;
            case session::LoginState::kPending2FA:
                SetHeader(reply.mutable_header(), 2, "Two-factor code required");
                break;
            case session::LoginState::kFailed:
                SetHeader(reply.mutable_header(), -1, s.error.empty() ? "Login failed" : s.error);
                break;
            case session::LoginState::kPendingPassword:
                SetHeader(reply.mutable_header(), -1, "Login did not finish");
                break;
        }
        cb(reply);
    });
    if (!watching) {
        manager::LoginReply reply;
        SetHeader(reply.mutable_header(), -1, "Login session expired");
        reply.mutable_data()->set_username(username);
        cb(reply);
    }
}

manager::LogoutReply ManagerService::HandleLogout(const manager::LogoutRequest& request) {
    const std::string& username = request.data().username();
    manager::LogoutReply reply;
    reply.mutable_data()->set_username(username);

    balancer::InstancePtr instance = pool_->GetByUsername(username);
    if (!instance) {
        SetHeader(reply.mutable_header(), -1, "Account " + username + " not found");
        return reply;
    }

    std::string message;
    const bool removed = pool_->Remove(instance->instanceId, &message);
    SetHeader(reply.mutable_header(), removed ? 0 : -1, message);
    return reply;
}

manager::DecryptReply ManagerService::KeepaliveReply(const manager::DecryptRequest& request) {
    manager::DecryptReply reply;
    SetHeader(reply.mutable_header(), 0, kSuccess);
    manager::DecryptData* data = reply.mutable_data();
    data->set_adam_id(kKeepaliveAdamId);
    data->set_key(request.data().key());
    data->set_sample_index(request.data().sample_index());
    return reply;
}

void ManagerService::HandleDecrypt(const manager::DecryptRequest& request, ReplyCallback<manager::DecryptReply> cb) {
    const manager::DecryptData& in = request.data();
    if (in.adam_id() == kKeepaliveAdamId) {
        cb(KeepaliveReply(request));
        return;
    }

    auto makeReply = [in](bool ok, const std::string& msg, const std::string& sample) {
        manager::DecryptReply reply;
        SetHeader(reply.mutable_header(), ok ? 0 : -1, msg);
        manager::DecryptData* out = reply.mutable_data();
        out->set_adam_id(in.adam_id());
        out->set_key(in.key());
        out->set_sample_index(in.sample_index());
        out->set_sample(sample);
        return reply;
    };

    std::string error;
    std::optional<balancer::DecryptTask> task =
        balancer::DecryptTask::Make(in.adam_id(), in.key(), in.sample(), in.sample_index(), &error);
    if (!task) {
        cb(makeReply(false, error, std::string()));
        return;
    }

    LOG_DEBUG << "[Decrypt] Dispatching " << in.adam_id() << "[" << in.sample_index() << "]";
    try {
        dispatcher_->Dispatch(std::move(*task), [cb, makeReply](balancer::DecryptResult result) {
            if (!result.success) {
                cb(makeReply(false, result.error.empty() ? "decrypt failed" : result.error, std::string()));
            } else {
                cb(makeReply(true, kSuccess, result.data));
            }
        });
    } catch (const std::exception& e) {
        LOG_ERROR << "Decrypt task error for " << in.adam_id() << ": " << e.what();
        cb(makeReply(false, e.what(), std::string()));
    }
}

balancer::InstancePtr ManagerService::FirstActive() const {
    for (const auto& instance : pool_->List()) {
        if (instance->IsActive()) return instance;
    }
    return nullptr;
}

balancer::InstancePtr ManagerService::ActiveForRegion(const std::string& region) const {
    balancer::InstancePtr fallback;
    for (const auto& instance : pool_->List()) {
        if (!instance->IsActive()) continue;
        if (EqualsIgnoreCase(instance->region, region)) return instance;
        if (!fallback) fallback = instance;
    }
    return fallback;
}

void ManagerService::HandleM3u8(const manager::M3U8Request& request, ReplyCallback<manager::M3U8Reply> cb) {
    const std::string adamId = request.data().adam_id();
    balancer::InstancePtr instance = FirstActive();
    if (!instance) {
        manager::M3U8Reply reply;
        SetHeader(reply.mutable_header(), -1, kNoInstance);
        cb(reply);
        return;
    }

    instance->Touch();
    instance->proxy->GetM3u8(adamId, [adamId, cb](worker::M3u8Outcome outcome) {
        manager::M3U8Reply reply;
        SetHeader(reply.mutable_header(), outcome.ok ? 0 : -1, outcome.ok ? kSuccess : outcome.error);
        reply.mutable_data()->set_adam_id(adamId);
        reply.mutable_data()->set_m3u8(outcome.url);
        cb(reply);
    });
}

void ManagerService::HandleLyrics(const manager::LyricsRequest& request, ReplyCallback<manager::LyricsReply> cb) {
    const manager::LyricsDataRequest data = request.data();
    balancer::InstancePtr instance = ActiveForRegion(data.region());
    if (!instance) {
        manager::LyricsReply reply;
        SetHeader(reply.mutable_header(), -1, kNoInstance);
        cb(reply);
        return;
    }

    auto fail = [cb](const std::string& msg) {
        manager::LyricsReply reply;
        SetHeader(reply.mutable_header(), -1, msg);
        cb(reply);
    };

    instance->Touch();
    const std::string region = instance->region;
    catalog::CatalogClient* catalog = catalog_;
    instance->proxy->GetAccountInfo([data, region, catalog, cb, fail](std::optional<worker::AccountInfo> info) {
        if (!info) {
            fail("Cannot get account info");
            return;
        }
        if (info->devToken.empty() || info->mediaToken.empty()) {
            fail(std::string("Missing tokens: dev_token=") + (info->devToken.empty() ? "false" : "true") +
                 ", media_token=" + (info->mediaToken.empty() ? "false" : "true"));
            return;
        }

        catalog::LyricsQuery query;
        query.adamId = data.adam_id();
        query.language = data.language();
        query.region = region;
        query.devToken = info->devToken;
        query.mediaToken = info->mediaToken;
        catalog->FetchLyrics(query, [data, cb, fail](catalog::LyricsOutcome outcome) {
            if (!outcome.ok) {
                fail(outcome.error);
                return;
            }
            manager::LyricsReply reply;
            SetHeader(reply.mutable_header(), 0, kSuccess);
            reply.mutable_data()->set_adam_id(data.adam_id());
            reply.mutable_data()->set_lyrics(outcome.ttml);
            cb(reply);
        });
    });
}

} // namespace service
} // namespace wrapmgr
