#include "wrapmgr/catalog/CatalogClient.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/protocol/HttpResponseParser.h"
#include "wrapmgr/common/JsonLite.h"
#include "wrapmgr/common/Logger.h"

#include <cctype>

namespace wrapmgr {
namespace catalog {

CatalogClient::CatalogClient(network::EventLoop* loop, Options options)
    : loop_(loop),
      options_(std::move(options)) {
}

CatalogClient::~CatalogClient() {
    for (auto& kv : fetches_) kv.second->conn->Close();
}

bool CatalogClient::Init() {
    Resolve();
    if (!options_.useTls) return true;
    std::unique_ptr<network::TlsContext> tls(new network::TlsContext());
    if (!tls->InitClient(options_.verifyPeer, options_.caFile)) {
        LOG_ERROR << "Catalog client: TLS init failed";
        return false;
    }
    tls_ = std::move(tls);
    return true;
}

bool CatalogClient::Resolve() {
    if (resolved_) return true;
    resolved_ = network::InetAddress::Resolve(options_.host, options_.port, &addr_);
    if (!resolved_) LOG_WARN << "Catalog client: cannot resolve " << options_.host;
    return resolved_;
}

std::string CatalogClient::UrlEncode(const std::string& s) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string CatalogClient::LyricsPath(const std::string& region, const std::string& adamId, const std::string& language) {
    return "/v1/catalog/" + UrlEncode(region) + "/songs/" + UrlEncode(adamId) + "/syllable-lyrics" +
           "?" + UrlEncode("l[lyrics]") + "=" + UrlEncode(language) +
           "&extend=ttmlLocalizations" +
           "&" + UrlEncode("l[script]") + "=en-Latn";
}

LyricsOutcome CatalogClient::ParseLyrics(int status, const std::string& body) {
    LyricsOutcome outcome;
    if (status != 200) {
        outcome.error = "Lyrics API failed: HTTP " + std::to_string(status);
        return outcome;
    }

    size_t root = 0;
    if (!common::json::Root(body, &root) || body[root] != '{') {
        outcome.error = "Lyrics API returned invalid JSON";
        return outcome;
    }

    size_t pos = 0;
    if (common::json::FindMember(body, root, "errors", &pos)) {
        size_t end = pos;
        common::json::SkipValue(body, &end);
        outcome.error = "API error: " + body.substr(pos, end - pos);
        return outcome;
    }

    if (!common::json::FindPath(body, {"data", "0", "attributes", "ttmlLocalizations"}, &pos) ||
        common::json::IsNull(body, pos) ||
        !common::json::ParseString(body, pos, &outcome.ttml) ||
        outcome.ttml.empty()) {
        outcome.ttml.clear();
        outcome.error = "No lyrics found";
        return outcome;
    }

    outcome.ok = true;
    return outcome;
}

void CatalogClient::Reject(LyricsCallback cb, const std::string& error) {
    loop_->QueueInLoop([cb, error]() {
        LyricsOutcome outcome;
        outcome.error = error;
        cb(std::move(outcome));
    });
}

void CatalogClient::FetchLyrics(const LyricsQuery& query, LyricsCallback cb) {
    if (shutdown_) {
        Reject(std::move(cb), "Server shutting down");
        return;
    }
    if (fetches_.size() >= options_.maxInFlight) {
        LOG_WARN << "[Lyrics] " << fetches_.size() << " requests in flight, rejecting adam_id=" << query.adamId;
        Reject(std::move(cb), "Too many lyrics requests in flight");
        return;
    }
    if (options_.useTls && !tls_) {
        Reject(std::move(cb), "TLS not initialised");
        return;
    }
    if (!Resolve()) {
        Reject(std::move(cb), "Cannot resolve " + options_.host);
        return;
    }

    const std::string path = LyricsPath(query.region, query.adamId, query.language);
    std::map<std::string, std::string> headers{
        {"User-Agent", options_.userAgent},
        {"Authorization", "Bearer " + query.devToken},
        {"media-user-token", query.mediaToken},
        {"Origin", options_.origin},
        {"Accept", "application/json"},
    };
    const std::string hostHeader = (options_.port == 443 || options_.port == 80)
        ? options_.host
        : options_.host + ":" + std::to_string(options_.port);
    const std::string request = protocol::HttpResponseParser::BuildGet(hostHeader, path, headers);

    LOG_DEBUG << "[Lyrics] GET " << options_.host << path;

    auto fetch = std::make_shared<Fetch>();
    fetch->id = ++nextFetchId_;
    fetch->cb = std::move(cb);
    fetch->conn = network::TcpExchange::Create(loop_, addr_, options_.timeoutSec);
    fetches_[fetch->id] = fetch;

    auto send = [this, fetch, request]() {
        fetch->conn->Write(request, [this, fetch]() { ReadReply(fetch); });
    };
    fetch->conn->Connect(
        [this, fetch, send]() {
            if (tls_) {
                fetch->conn->StartTls(tls_->ctx(), options_.host, tls_->verifyPeer(), send);
            } else {
                send();
            }
        },
        [this, fetch](const std::string& error) {
            LOG_WARN << "[Lyrics] " << options_.host << " failed: " << error;
            LyricsOutcome outcome;
            outcome.error = error;
            Finish(fetch, std::move(outcome));
        });
}

void CatalogClient::ReadReply(const FetchPtr& fetch) {
    auto parser = std::make_shared<protocol::HttpResponseParser>();
    auto fed = std::make_shared<size_t>(0);
    fetch->conn->ReadUntil(
        [parser, fed](const std::string& buffer, size_t* consumed) {
            if (buffer.size() > *fed) {
                parser->Feed(buffer.data() + *fed, buffer.size() - *fed);
                *fed = buffer.size();
            }
            if (!parser->gotAll() && !parser->hasError()) return false;
            *consumed = buffer.size();
            return true;
        },
        true,
        [this, fetch, parser](std::string) {
            if (!parser->gotAll() && !parser->hasError()) parser->Finish();
            LyricsOutcome outcome;
            if (parser->gotAll()) {
                outcome = ParseLyrics(parser->statusCode(), parser->body());
            } else {
                outcome.error = "Malformed HTTP response";
            }
            Finish(fetch, std::move(outcome));
        });
}

void CatalogClient::Finish(const FetchPtr& fetch, LyricsOutcome outcome) {
    if (fetches_.erase(fetch->id) == 0) return;
    fetch->conn->Close();
    LyricsCallback cb = std::move(fetch->cb);
    fetch->cb = nullptr;
    if (cb) cb(std::move(outcome));
}

void CatalogClient::Shutdown() {
    if (shutdown_) return;
    shutdown_ = true;
    std::map<uint64_t, FetchPtr> pending;
    pending.swap(fetches_);
    if (!pending.empty()) LOG_INFO << "Catalog client: failing " << pending.size() << " pending requests";
    for (auto& kv : pending) {
        kv.second->conn->Close();
        LyricsCallback cb = std::move(kv.second->cb);
        kv.second->cb = nullptr;
        if (!cb) continue;
        LyricsOutcome outcome;
        outcome.error = "Server shutting down";
        cb(std::move(outcome));
    }
}

} // namespace catalog
} // namespace wrapmgr
