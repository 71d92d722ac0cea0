#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace wrapmgr {
namespace protocol {

// Incremental HTTP/1.x response parser that keeps the decoded body.
// - Supports Content-Length and Transfer-Encoding: chunked.
// - Without either, the body runs until the peer closes (call Finish()).
class HttpResponseParser {
public:
    enum ParseState { kExpectHeaders, kExpectBody, kGotAll, kError };

    // Returns true once the response is complete.
    bool Feed(const char* data, size_t len);
    // Peer closed the connection. Completes a close-delimited body.
    bool Finish();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    int statusCode() const { return statusCode_; }
    const std::string& body() const { return body_; }
    // Case-insensitive header lookup; empty if absent.
    std::string header(const std::string& name) const;

    void Reset();

    // "GET path HTTP/1.1" with Host, Connection: close and extra headers.
    static std::string BuildGet(const std::string& host,
                                const std::string& path,
                                const std::map<std::string, std::string>& headers);

private:
    static std::string ToLowerCopy(const std::string& s);

    bool ParseHeaderBlock(const std::string& headerBlock);
    bool ConsumeBody(const char* data, size_t len);
    bool ConsumeChunked(const char* data, size_t len);

    ParseState state_{kExpectHeaders};
    std::string headerBuf_;

    int statusCode_{0};
    std::map<std::string, std::string> headers_; // lower-case keys
    bool chunked_{false};
    bool untilClose_{false};
    size_t bodyRemaining_{0};
    std::string body_;

    // chunked parsing
    bool expectingChunkSize_{true};
    std::string chunkLineBuf_;
    size_t chunkRemaining_{0};
    size_t chunkCrlfRemaining_{0};
    bool trailer_{false};
    std::string trailerBuf_;
};

} // namespace protocol
} // namespace wrapmgr
