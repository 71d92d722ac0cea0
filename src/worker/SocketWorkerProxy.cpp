#include "wrapmgr/worker/SocketWorkerProxy.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/protocol/HttpResponseParser.h"
#include "wrapmgr/protocol/WorkerWire.h"
#include "wrapmgr/common/JsonLite.h"
#include "wrapmgr/common/Logger.h"

namespace wrapmgr {
namespace worker {

namespace {

const char* const kNotActive = "Proxy not active";
const char* const kUserAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";

std::map<std::string, std::string> AccountHeaders() {
    return {
        {"User-Agent", kUserAgent},
        {"Accept", "application/json"},
    };
}

bool JsonFlag(const std::string& body, const std::string& key) {
    size_t root = 0;
    size_t pos = 0;
    if (!common::json::Root(body, &root)) return false;
    if (!common::json::FindMember(body, root, key, &pos)) return false;
    return body.compare(pos, 4, "true") == 0;
}

} // namespace

struct SocketWorkerProxy::BatchState {
    std::shared_ptr<SocketWorkerProxy> proxy;
    network::TcpExchangePtr conn;
    std::string adamId;
    std::vector<std::string> samples;
    std::vector<std::string> results;
    size_t next{0};
    BatchCallback cb;
    bool finished{false};

    void Complete(BatchOutcome outcome) {
        if (finished) return;
        finished = true;
        if (conn) conn->Close();
        BatchCallback done = std::move(cb);
        cb = nullptr;
        if (done) done(std::move(outcome));
    }
};

SocketWorkerProxy::SocketWorkerProxy(network::EventLoop* loop, std::string instanceId, WorkerEndpoint endpoint)
    : loop_(loop),
      instanceId_(std::move(instanceId)),
      endpoint_(std::move(endpoint)) {
}

void SocketWorkerProxy::Defer(std::function<void()> fn) {
    loop_->QueueInLoop(std::move(fn));
}

bool SocketWorkerProxy::Resolve(uint16_t port, network::InetAddress* out) const {
    if (!network::InetAddress::Resolve(endpoint_.host, port, out)) {
        LOG_ERROR << "[" << instanceId_ << "] cannot resolve worker host " << endpoint_.host;
        return false;
    }
    return true;
}

void SocketWorkerProxy::Start(StartCallback cb) {
    const uint64_t generation = ++startGeneration_;

    if (!endpoint_.verifyOnStart) {
        active_ = true;
        LOG_DEBUG << "Wrapper proxy started: " << instanceId_;
        Defer([cb]() {
            StartResult result;
            result.ok = true;
            cb(result);
        });
        return;
    }

    auto self = std::static_pointer_cast<SocketWorkerProxy>(shared_from_this());
    HttpGet("/account", AccountHeaders(), endpoint_.accountTimeoutSec,
            [self, generation, cb](const HttpReply& reply) {
        StartResult result;
        if (generation != self->startGeneration_) {
            result.reason = StartError::kUnavailable;
            result.message = "Start cancelled";
            cb(result);
            return;
        }
        if (!reply.transportOk) {
            result.reason = StartError::kUnavailable;
            result.message = reply.error;
        } else if (reply.status == 200) {
            result.ok = true;
        } else if (reply.status == 401 || reply.status == 403) {
            const bool needs2fa = JsonFlag(reply.body, "two_factor_required") || JsonFlag(reply.body, "need_2fa");
            result.reason = needs2fa ? StartError::kTwoFactorRequired : StartError::kAuthFailed;
            result.message = needs2fa ? "2FA required" : "Authentication failed (HTTP " + std::to_string(reply.status) + ")";
        } else {
            result.reason = StartError::kUnavailable;
            result.message = "HTTP " + std::to_string(reply.status);
        }

        if (result.ok) {
            self->active_ = true;
            LOG_DEBUG << "Wrapper proxy started: " << self->instanceId_;
        } else {
            LOG_WARN << "[" << self->instanceId_ << "] start failed (" << StartErrorName(result.reason)
                     << "): " << result.message;
        }
        cb(result);
    });
}

void SocketWorkerProxy::Stop() {
    ++startGeneration_;
    if (!active_) return;
    active_ = false;
    LOG_DEBUG << "Wrapper proxy stopped: " << instanceId_;
}

void SocketWorkerProxy::Decrypt(const std::string& adamId,
                                const std::string& key,
                                std::string sample,
                                int sampleIndex,
                                DecryptCallback cb) {
    std::vector<std::string> samples;
    samples.push_back(std::move(sample));
    LOG_DEBUG << "[Decrypt] " << instanceId_ << " adam_id=" << adamId << " sample_index=" << sampleIndex;
    DecryptBatch(adamId, key, std::move(samples), [cb](BatchOutcome batch) {
        DecryptOutcome outcome;
        outcome.ok = batch.ok;
        outcome.error = std::move(batch.error);
        if (batch.ok && !batch.data.empty()) outcome.data = std::move(batch.data.front());
        cb(std::move(outcome));
    });
}

void SocketWorkerProxy::DecryptBatch(const std::string& adamId,
                                     const std::string& key,
                                     std::vector<std::string> samples,
                                     BatchCallback cb) {
    if (!active_) {
        Defer([cb]() {
            BatchOutcome outcome;
            outcome.error = kNotActive;
            cb(std::move(outcome));
        });
        return;
    }

    std::string handshake;
    network::InetAddress addr;
    std::string error;
    if (!protocol::wire::EncodeDecryptHandshake(adamId, key, &handshake)) {
        error = "adam_id or key exceeds 255 bytes";
    } else if (!Resolve(endpoint_.decryptPort, &addr)) {
        error = "Cannot resolve " + endpoint_.host;
    }
    if (!error.empty()) {
        Defer([cb, error]() {
            BatchOutcome outcome;
            outcome.error = error;
            cb(std::move(outcome));
        });
        return;
    }

    auto state = std::make_shared<BatchState>();
    state->proxy = std::static_pointer_cast<SocketWorkerProxy>(shared_from_this());
    state->adamId = adamId;
    state->samples = std::move(samples);
    state->results.reserve(state->samples.size());
    state->cb = std::move(cb);
    state->conn = network::TcpExchange::Create(loop_, addr, endpoint_.callTimeoutSec);

    LOG_INFO << "[Decrypt] Connecting to " << addr.toIpPort() << " with adam_id=" << adamId
             << ", samples=" << state->samples.size();

    state->conn->Connect(
        [state, handshake]() {
            state->conn->Write(handshake, [state]() { DecryptNext(state); });
        },
        [state](const std::string& err) {
            LOG_ERROR << "[Decrypt] " << state->conn->peer().toIpPort() << " adam_id=" << state->adamId
                      << " failed after " << state->results.size() << "/" << state->samples.size()
                      << " samples: " << err;
            BatchOutcome outcome;
            outcome.error = err;
            state->Complete(std::move(outcome));
        });
}

void SocketWorkerProxy::DecryptNext(std::shared_ptr<BatchState> state) {
    if (state->finished) return;

    if (state->next == state->samples.size()) {
        LOG_DEBUG << "[Decrypt] All " << state->samples.size() << " samples decrypted for " << state->adamId;
        BatchOutcome outcome;
        outcome.ok = true;
        outcome.data = std::move(state->results);
        state->Complete(std::move(outcome));
        return;
    }

    const std::string& sample = state->samples[state->next];
    const size_t expected = sample.size();
    state->conn->Write(protocol::wire::EncodeSample(sample), [state, expected]() {
        state->conn->ReadExactly(expected, [state](std::string plain) {
            state->samples[state->next].clear();
            state->results.push_back(std::move(plain));
            ++state->next;
            DecryptNext(state);
        });
    });
}

void SocketWorkerProxy::GetM3u8(const std::string& adamId, M3u8Callback cb) {
    if (!active_) {
        Defer([cb]() {
            M3u8Outcome outcome;
            outcome.error = kNotActive;
            cb(std::move(outcome));
        });
        return;
    }
    M3u8Attempt(adamId, 1, std::move(cb));
}

void SocketWorkerProxy::M3u8Attempt(const std::string& adamId, int attempt, M3u8Callback cb) {
    std::string request;
    network::InetAddress addr;
    std::string error;
    if (!protocol::wire::EncodeM3u8Request(adamId, &request)) {
        error = "adam_id exceeds 255 bytes";
    } else if (!Resolve(endpoint_.m3u8Port, &addr)) {
        error = "Cannot resolve " + endpoint_.host;
    }
    if (!error.empty()) {
        Defer([cb, error]() {
            M3u8Outcome outcome;
            outcome.error = error;
            cb(std::move(outcome));
        });
        return;
    }

    auto self = std::static_pointer_cast<SocketWorkerProxy>(shared_from_this());
    auto conn = network::TcpExchange::Create(loop_, addr, endpoint_.callTimeoutSec);
    LOG_DEBUG << "[M3U8] Connecting to " << addr.toIpPort() << " for adam_id=" << adamId << " (attempt " << attempt << ")";

    conn->Connect(
        [conn, request, cb]() {
            conn->Write(request, [conn, cb]() {
                conn->ReadLine([conn, cb](std::string line) {
                    conn->Close();
                    M3u8Outcome outcome;
                    if (protocol::wire::ParseM3u8Line(line, &outcome.url)) {
                        outcome.ok = true;
                        LOG_DEBUG << "[M3U8] Success: got URL length " << outcome.url.size();
                    } else if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                        outcome.error = "Failed to get M3U8 URL";
                        LOG_ERROR << "[M3U8] Failed: empty response";
                    } else {
                        outcome.error = "Invalid M3U8 response: " + line;
                        LOG_ERROR << "[M3U8] Failed: " << outcome.error;
                    }
                    cb(std::move(outcome));
                });
            });
        },
        [self, adamId, attempt, cb](const std::string& err) {
            if (attempt < self->endpoint_.m3u8Attempts && self->active_) {
                const double delay = self->endpoint_.m3u8RetryDelaySec * static_cast<double>(1 << (attempt - 1));
                LOG_WARN << "[M3U8] " << adamId << " attempt " << attempt << " failed: " << err
                         << ", retrying in " << delay << "s";
                self->loop_->RunAfter(delay, [self, adamId, attempt, cb]() {
                    self->M3u8Attempt(adamId, attempt + 1, cb);
                });
                return;
            }
            LOG_ERROR << "[M3U8] " << adamId << " failed: " << err;
            M3u8Outcome outcome;
            outcome.error = err;
            cb(std::move(outcome));
        });
}

void SocketWorkerProxy::GetAccountInfo(AccountCallback cb) {
    if (!active_) {
        Defer([cb]() { cb(std::nullopt); });
        return;
    }

    const std::string id = instanceId_;
    HttpGet("/account", AccountHeaders(), endpoint_.accountTimeoutSec, [id, cb](const HttpReply& reply) {
        if (!reply.transportOk) {
            LOG_ERROR << "Failed to get account info for " << id << ": " << reply.error;
            cb(std::nullopt);
            return;
        }
        if (reply.status != 200) {
            LOG_ERROR << "Account info request failed: " << reply.status;
            cb(std::nullopt);
            return;
        }

        AccountInfo info;
        common::json::GetString(reply.body, "dev_token", &info.devToken);
        if (!common::json::GetString(reply.body, "media_token", &info.mediaToken) || info.mediaToken.empty()) {
            common::json::GetString(reply.body, "music_token", &info.mediaToken);
        }
        common::json::GetString(reply.body, "storefront", &info.storefront);

        if (info.devToken.empty() || info.mediaToken.empty()) {
            LOG_WARN << "Account info for " << id << " is missing tokens";
            cb(std::nullopt);
            return;
        }
        cb(std::move(info));
    });
}

void SocketWorkerProxy::HealthCheck(double timeoutSec, ProbeCallback cb) {
    if (!active_) {
        Defer([cb]() {
            ProbeResult result;
            result.transportError = true;
            result.error = kNotActive;
            cb(result);
        });
        return;
    }

    HttpGet("/account", {}, timeoutSec, [cb](const HttpReply& reply) {
        ProbeResult result;
        if (!reply.transportOk) {
            result.transportError = true;
            result.error = reply.error;
        } else if (reply.status == 200) {
            result.healthy = true;
        } else {
            result.error = "HTTP " + std::to_string(reply.status);
        }
        cb(result);
    });
}

void SocketWorkerProxy::HttpGet(const std::string& path,
                                const std::map<std::string, std::string>& headers,
                                double timeoutSec,
                                HttpCallback cb) {
    network::InetAddress addr;
    if (!Resolve(endpoint_.accountPort, &addr)) {
        const std::string host = endpoint_.host;
        Defer([cb, host]() {
            HttpReply reply;
            reply.error = "Cannot resolve " + host;
            cb(reply);
        });
        return;
    }

    const std::string request = protocol::HttpResponseParser::BuildGet(
        endpoint_.host + ":" + std::to_string(endpoint_.accountPort), path, headers);
    auto parser = std::make_shared<protocol::HttpResponseParser>();
    auto fed = std::make_shared<size_t>(0);
    auto conn = network::TcpExchange::Create(loop_, addr, timeoutSec);

    conn->Connect(
        [conn, request, parser, fed, cb]() {
            conn->Write(request, [conn, parser, fed, cb]() {
                auto complete = [parser, fed](const std::string& buffer, size_t* consumed) {
                    if (buffer.size() > *fed) {
                        parser->Feed(buffer.data() + *fed, buffer.size() - *fed);
                        *fed = buffer.size();
                    }
                    if (parser->gotAll() || parser->hasError()) {
                        *consumed = buffer.size();
                        return true;
                    }
                    return false;
                };
                conn->ReadUntil(complete, true, [conn, parser, cb](std::string) {
                    conn->Close();
                    if (!parser->gotAll() && !parser->hasError()) parser->Finish();
                    HttpReply reply;
                    if (parser->gotAll()) {
                        reply.transportOk = true;
                        reply.status = parser->statusCode();
                        reply.body = parser->body();
                    } else {
                        reply.error = "Malformed HTTP response";
                    }
                    cb(reply);
                });
            });
        },
        [cb](const std::string& err) {
            HttpReply reply;
            reply.error = err;
            cb(reply);
        });
}

} // namespace worker
} // namespace wrapmgr
