#pragma once

#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/network/InetAddress.h"
#include "wrapmgr/network/TcpExchange.h"
#include "wrapmgr/network/TlsContext.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace wrapmgr {
namespace network {
class EventLoop;
}

namespace catalog {

struct LyricsQuery {
    std::string adamId;
    std::string language;
    std::string region;
    std::string devToken;
    std::string mediaToken;
};

struct LyricsOutcome {
    bool ok{false};
    std::string ttml;
    std::string error;
};

// HTTPS client for the public catalog API. Each request is one TcpExchange on
// the loop (TLS when useTls), answered through its callback exactly once.
// Shutdown() answers every request still in flight and refuses new ones.
//
// Loop thread only.
class CatalogClient : wrapmgr::common::noncopyable {
public:
    struct Options {
        std::string host{"amp-api.music.apple.com"};
        uint16_t port{443};
        bool useTls{true};
        bool verifyPeer{true};
        std::string caFile;
        double timeoutSec{30.0};
        size_t maxInFlight{32};
        std::string userAgent{"Music/5.7 Android/10 model/Pixel6GR1YH build/1234 (dt:66)"};
        std::string origin{"https://music.apple.com"};
    };

    using LyricsCallback = std::function<void(LyricsOutcome)>;

    CatalogClient(network::EventLoop* loop, Options options);
    ~CatalogClient();

    // Sets up the TLS context and resolves the host; false if TLS is on and
    // cannot be initialised. An unresolved host is retried per request.
    bool Init();

    void FetchLyrics(const LyricsQuery& query, LyricsCallback cb);
    void Shutdown();

    size_t inFlight() const { return fetches_.size(); }

    static std::string LyricsPath(const std::string& region, const std::string& adamId, const std::string& language);
    // Pulls data[0].attributes.ttmlLocalizations out of a catalog reply.
    static LyricsOutcome ParseLyrics(int status, const std::string& body);
    static std::string UrlEncode(const std::string& s);

private:
    struct Fetch {
        uint64_t id{0};
        network::TcpExchangePtr conn;
        LyricsCallback cb;
    };
    using FetchPtr = std::shared_ptr<Fetch>;

    bool Resolve();
    void ReadReply(const FetchPtr& fetch);
    void Finish(const FetchPtr& fetch, LyricsOutcome outcome);
    void Reject(LyricsCallback cb, const std::string& error);

    network::EventLoop* loop_;
    Options options_;
    std::unique_ptr<network::TlsContext> tls_;
    network::InetAddress addr_;
    bool resolved_{false};
    bool shutdown_{false};

    uint64_t nextFetchId_{0};
    std::map<uint64_t, FetchPtr> fetches_;
};

} // namespace catalog
} // namespace wrapmgr
