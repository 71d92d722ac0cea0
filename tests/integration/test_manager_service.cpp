#include "wrapmgr/ManagerServer.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"
#include "../support/FakeWorkerProxy.h"

#include "manager.pb.h"

#include <google/protobuf/empty.pb.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/security/credentials.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

using namespace wrapmgr;

namespace {

uint16_t ClosedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof addr);
    socklen_t len = sizeof addr;
    ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

// Blocking client call over the generic stub. Unary methods are driven the
// same way: one frame out, half-close, one frame back.
class SyncCall {
public:
    SyncCall(grpc::GenericStub* stub, const std::string& method) {
        ctx_.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(10));
        call_ = stub->PrepareCall(&ctx_, method, &cq_);
        call_->StartCall(Tag(1));
        Wait(1);
    }

    ~SyncCall() {
        cq_.Shutdown();
        void* tag;
        bool ok;
        while (cq_.Next(&tag, &ok)) {
        }
    }

    template <typename Message>
    bool Write(const Message& msg) {
        grpc::ByteBuffer buf;
        bool own = false;
        if (!grpc::SerializationTraits<Message>::Serialize(msg, &buf, &own).ok()) return false;
        call_->Write(buf, Tag(2));
        return Wait(2);
    }

    template <typename Message>
    bool Read(Message* msg) {
        grpc::ByteBuffer buf;
        call_->Read(&buf, Tag(3));
        if (!Wait(3)) return false;
        return grpc::SerializationTraits<Message>::Deserialize(&buf, msg).ok();
    }

    void WritesDone() {
        call_->WritesDone(Tag(4));
        Wait(4);
    }

    grpc::Status Finish() {
        grpc::Status status;
        call_->Finish(&status, Tag(5));
        Wait(5);
        return status;
    }

private:
    static void* Tag(intptr_t t) { return reinterpret_cast<void*>(t); }

    bool Wait(intptr_t expected) {
        void* tag = nullptr;
        bool ok = false;
        if (!cq_.Next(&tag, &ok)) return false;
        return tag == Tag(expected) && ok;
    }

    grpc::ClientContext ctx_;
    grpc::CompletionQueue cq_;
    std::unique_ptr<grpc::GenericClientAsyncReaderWriter> call_;
};

template <typename Reply, typename Request>
bool Unary(grpc::GenericStub* stub, const std::string& method, const Request& request, Reply* reply,
           grpc::Status* status) {
    SyncCall call(stub, method);
    const bool wrote = call.Write(request);
    call.WritesDone();
    const bool read = wrote && call.Read(reply);
    *status = call.Finish();
    return read;
}

} // namespace

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    network::EventLoop loop;

    std::atomic<int> failures{0};
    auto check = [&](bool cond, const char* what) {
        if (!cond) {
            LOG_ERROR << "check failed: " << what;
            ++failures;
        }
    };

    ManagerServer::Options options;
    options.listenAddress = "127.0.0.1:0";
    options.healthEnabled = false;
    options.catalog.host = "127.0.0.1";
    options.catalog.port = ClosedPort();
    options.catalog.useTls = false;
    options.catalog.timeoutSec = 2.0;
    options.login.gracePeriodSec = 5.0;

    ManagerServer server(&loop, options, [&loop](const worker::WorkerSpec& spec) {
        auto proxy = std::make_shared<testing::FakeWorkerProxy>(&loop);
        if (spec.username == "tfa@example.com" && spec.twoFactorCode != "123456") {
            proxy->startResult = {false, worker::StartError::kTwoFactorRequired, "2FA required"};
        }
        return proxy;
    });
    if (!server.Start()) {
        LOG_ERROR << "ManagerService: FAIL (cannot start)";
        return 1;
    }

    std::thread client([&]() {
        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server.port()),
                                           grpc::InsecureChannelCredentials());
        grpc::GenericStub stub(channel);
        grpc::Status status;

        {
            manager::StatusReply reply;
            check(Unary(&stub, service::kStatusMethod, google::protobuf::Empty(), &reply, &status), "status call");
            check(status.ok(), "status ok");
            check(reply.header().code() == 0 && reply.header().msg() == "SUCCESS", "status header");
            check(!reply.data().status() && reply.data().client_count() == 0, "no clients yet");
            check(reply.data().ready(), "ready after start");
        }

        {
            SyncCall login(&stub, service::kLoginMethod);
            manager::LoginRequest req;
            manager::LoginReply reply;

            req.mutable_data()->set_username("");
            check(login.Write(req) && login.Read(&reply), "empty username exchange");
            check(reply.header().code() == -1 && reply.header().msg() == "username is required", "username required");

            req.mutable_data()->set_username("alice@example.com");
            req.mutable_data()->set_password("pw");
            check(login.Write(req) && login.Read(&reply), "login exchange");
            check(reply.header().code() == 0, "alice logged in");
            check(reply.data().username() == "alice@example.com", "username echoed");

            check(login.Write(req) && login.Read(&reply), "relogin exchange");
            check(reply.header().code() == -1, "already logged in");

            req.mutable_data()->set_username("tfa@example.com");
            check(login.Write(req) && login.Read(&reply), "tfa exchange");
            check(reply.header().code() == 2, "code required");

            req.mutable_data()->set_two_step_code("123456");
            check(login.Write(req) && login.Read(&reply), "tfa code exchange");
            check(reply.header().code() == 0, "tfa logged in");

            login.WritesDone();
            check(login.Finish().ok(), "login stream closed cleanly");
        }

        {
            manager::StatusReply reply;
            check(Unary(&stub, service::kStatusMethod, google::protobuf::Empty(), &reply, &status), "status again");
            check(reply.data().status() && reply.data().client_count() == 2, "two clients");
            check(reply.data().regions_size() == 1 && reply.data().regions(0) == "us", "default region");
        }

        {
            SyncCall decrypt(&stub, service::kDecryptMethod);
            manager::DecryptRequest req;
            manager::DecryptReply reply;

            req.mutable_data()->set_adam_id("KEEPALIVE");
            req.mutable_data()->set_key("k");
            req.mutable_data()->set_sample_index(9);
            check(decrypt.Write(req) && decrypt.Read(&reply), "keepalive exchange");
            check(reply.header().code() == 0 && reply.data().adam_id() == "KEEPALIVE", "keepalive echoed");
            check(reply.data().sample_index() == 9 && reply.data().sample().empty(), "keepalive fields");

            req.mutable_data()->set_adam_id("1440818839");
            req.mutable_data()->set_key("skd://itunes.apple.com/P000000000/s1/e1");
            req.mutable_data()->set_sample_index(3);
            req.mutable_data()->set_sample("abcd");
            check(decrypt.Write(req) && decrypt.Read(&reply), "decrypt exchange");
            check(reply.header().code() == 0 && reply.header().msg() == "SUCCESS", "decrypt ok");
            check(reply.data().sample() == "dcba", "decrypted sample");
            check(reply.data().adam_id() == "1440818839" && reply.data().sample_index() == 3, "fields echoed");
            check(reply.data().key() == "skd://itunes.apple.com/P000000000/s1/e1", "key echoed");

            req.mutable_data()->set_adam_id(std::string(300, '1'));
            check(decrypt.Write(req) && decrypt.Read(&reply), "oversized exchange");
            check(reply.header().code() == -1 && reply.header().msg() == "adam_id exceeds 255 bytes", "oversized rejected");

            decrypt.WritesDone();
            check(decrypt.Finish().ok(), "decrypt stream closed cleanly");
        }

        {
            manager::M3U8Request req;
            req.mutable_data()->set_adam_id("42");
            manager::M3U8Reply reply;
            check(Unary(&stub, service::kM3u8Method, req, &reply, &status), "m3u8 call");
            check(reply.header().code() == 0, "m3u8 ok");
            check(reply.data().adam_id() == "42", "m3u8 adam id");
            check(reply.data().m3u8() == "https://example.com/master.m3u8?id=42", "m3u8 url");
        }

        {
            manager::LyricsRequest req;
            req.mutable_data()->set_adam_id("1440818839");
            req.mutable_data()->set_language("ja");
            req.mutable_data()->set_region("jp");
            manager::LyricsReply reply;
            check(Unary(&stub, service::kLyricsMethod, req, &reply, &status), "lyrics call");
            check(reply.header().code() == -1 && reply.header().msg() == "Connection refused", "catalog error surfaced");
        }

        {
            manager::LicenseRequest req;
            manager::LicenseReply reply;
            Unary(&stub, service::kLicenseMethod, req, &reply, &status);
            check(status.error_code() == grpc::StatusCode::UNIMPLEMENTED, "license unimplemented");
            check(status.error_message() == "License not implemented", "license message");
        }

        {
            manager::LogoutRequest req;
            req.mutable_data()->set_username("alice@example.com");
            manager::LogoutReply reply;
            check(Unary(&stub, service::kLogoutMethod, req, &reply, &status), "logout call");
            check(reply.header().code() == 0, "alice logged out");
            check(Unary(&stub, service::kLogoutMethod, req, &reply, &status), "second logout call");
            check(reply.header().code() == -1 && reply.header().msg() == "Account alice@example.com not found",
                  "unknown account");
        }

        {
            SyncCall empty(&stub, service::kLogoutMethod);
            empty.WritesDone();
            status = empty.Finish();
            check(status.error_code() == grpc::StatusCode::INVALID_ARGUMENT, "unary without request");
        }

        loop.QueueInLoop([&]() {
            server.Shutdown([&]() {
                check(server.pool()->ClientCount() == 0, "proxies stopped on shutdown");
                loop.Quit();
            });
        });
    });

    loop.Loop();
    client.join();

    if (failures) {
        LOG_ERROR << "ManagerService: FAIL";
        return 1;
    }
    LOG_INFO << "ManagerService: PASS";
    return 0;
}
