#pragma once

#include "wrapmgr/balancer/Dispatcher.h"
#include "wrapmgr/balancer/InstancePool.h"
#include "wrapmgr/catalog/CatalogClient.h"
#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/session/LoginSessionManager.h"

#include "manager.pb.h"

#include <grpcpp/generic/async_generic_service.h>

#include <atomic>
#include <functional>
#include <string>

namespace wrapmgr {
namespace network {
class EventLoop;
}

namespace service {

// Full method names as they appear on the wire.
extern const char kStatusMethod[];
extern const char kLoginMethod[];
extern const char kLogoutMethod[];
extern const char kDecryptMethod[];
extern const char kM3u8Method[];
extern const char kLyricsMethod[];
extern const char kLicenseMethod[];
extern const char kWebPlaybackMethod[];

// Frames with this adam_id are echoed back without touching a worker.
extern const char kKeepaliveAdamId[];

// WrapperManagerService on top of the generic callback API. Each call gets a
// reactor that decodes frames on the gRPC threads and hands them to the
// Handle* methods on the loop thread. Streams are strictly serial: the next
// frame is read only after the reply to the previous one was written.
class ManagerService : public grpc::CallbackGenericService,
                       wrapmgr::common::noncopyable {
public:
    template <typename Reply>
    using ReplyCallback = std::function<void(Reply)>;

    ManagerService(network::EventLoop* loop,
                   balancer::InstancePool* pool,
                   balancer::Dispatcher* dispatcher,
                   session::LoginSessionManager* sessions,
                   catalog::CatalogClient* catalog);

    void SetReady(bool ready) { ready_.store(ready); }
    bool ready() const { return ready_.load(); }

    network::EventLoop* loop() const { return loop_; }

    grpc::ServerGenericBidiReactor* CreateReactor(grpc::GenericCallbackServerContext* ctx) override;

    // Loop thread only. Every callback runs on the loop thread.
    manager::StatusReply HandleStatus() const;
    void HandleLogin(const manager::LoginRequest& request, ReplyCallback<manager::LoginReply> cb);
    manager::LogoutReply HandleLogout(const manager::LogoutRequest& request);
    void HandleDecrypt(const manager::DecryptRequest& request, ReplyCallback<manager::DecryptReply> cb);
    void HandleM3u8(const manager::M3U8Request& request, ReplyCallback<manager::M3U8Reply> cb);
    void HandleLyrics(const manager::LyricsRequest& request, ReplyCallback<manager::LyricsReply> cb);

    static manager::DecryptReply KeepaliveReply(const manager::DecryptRequest& request);

private:
    void AnswerLogin(const std::string& username,
                     const std::string& sessionId,
                     ReplyCallback<manager::LoginReply> cb);
    balancer::InstancePtr FirstActive() const;
    balancer::InstancePtr ActiveForRegion(const std::string& region) const;

    network::EventLoop* loop_;
    balancer::InstancePool* pool_;
    balancer::Dispatcher* dispatcher_;
    session::LoginSessionManager* sessions_;
    catalog::CatalogClient* catalog_;
    std::atomic_bool ready_{false};
};

} // namespace service
} // namespace wrapmgr
