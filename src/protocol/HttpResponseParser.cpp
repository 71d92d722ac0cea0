#include "wrapmgr/protocol/HttpResponseParser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace wrapmgr {
namespace protocol {

namespace {

bool IsWs(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string TrimWs(std::string s) {
    while (!s.empty() && IsWs(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && IsWs(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

} // namespace

std::string HttpResponseParser::ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string HttpResponseParser::header(const std::string& name) const {
    auto it = headers_.find(ToLowerCopy(name));
    return it == headers_.end() ? std::string() : it->second;
}

void HttpResponseParser::Reset() {
    *this = HttpResponseParser();
}

std::string HttpResponseParser::BuildGet(const std::string& host,
                                         const std::string& path,
                                         const std::map<std::string, std::string>& headers) {
    std::string req = "GET " + (path.empty() ? std::string("/") : path) + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";
    for (const auto& kv : headers) {
        req += kv.first + ": " + kv.second + "\r\n";
    }
    req += "Connection: close\r\n\r\n";
    return req;
}

bool HttpResponseParser::ParseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    size_t lineEnd = headerBlock.find("\r\n");
    if (lineEnd == std::string::npos) {
        state_ = kError;
        return false;
    }
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    size_t pos = lineEnd + 2;

    // HTTP/1.1 200 OK
    if (statusLine.rfind("HTTP/", 0) != 0) {
        state_ = kError;
        return false;
    }
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > statusLine.size()) {
        state_ = kError;
        return false;
    }
    statusCode_ = 0;
    for (size_t i = sp1 + 1; i < sp1 + 4; ++i) {
        const char c = statusLine[i];
        if (c < '0' || c > '9') {
            state_ = kError;
            return false;
        }
        statusCode_ = statusCode_ * 10 + (c - '0');
    }

    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers_[ToLowerCopy(TrimWs(line.substr(0, colon)))] = TrimWs(line.substr(colon + 1));
    }

    const std::string te = ToLowerCopy(header("transfer-encoding"));
    const std::string cl = header("content-length");
    chunked_ = te.find("chunked") != std::string::npos;
    untilClose_ = false;
    bodyRemaining_ = 0;

    if (chunked_) {
        expectingChunkSize_ = true;
    } else if (!cl.empty()) {
        char* endp = nullptr;
        const unsigned long long n = std::strtoull(cl.c_str(), &endp, 10);
        if (endp == cl.c_str()) {
            state_ = kError;
            return false;
        }
        bodyRemaining_ = static_cast<size_t>(n);
    } else if (statusCode_ == 204 || statusCode_ == 304 || (statusCode_ >= 100 && statusCode_ < 200)) {
        bodyRemaining_ = 0;
    } else {
        untilClose_ = true;
    }

    state_ = (!chunked_ && !untilClose_ && bodyRemaining_ == 0) ? kGotAll : kExpectBody;
    return true;
}

bool HttpResponseParser::ConsumeChunked(const char* data, size_t len) {
    size_t off = 0;
    while (off < len && state_ == kExpectBody) {
        const char* p = data + off;
        const size_t avail = len - off;

        if (trailer_) {
            // Trailer section ends with an empty line; right after the last
            // chunk that is just "\r\n".
            trailerBuf_.append(p, avail);
            if (trailerBuf_.rfind("\r\n", 0) == 0 || trailerBuf_.find("\r\n\r\n") != std::string::npos) {
                state_ = kGotAll;
            } else if (trailerBuf_.size() > 8192) {
                state_ = kError;
                return false;
            }
            return true;
        }

        if (expectingChunkSize_) {
            chunkLineBuf_.push_back(p[0]);
            ++off;
            const size_t n = chunkLineBuf_.size();
            if (n < 2 || chunkLineBuf_[n - 2] != '\r' || chunkLineBuf_[n - 1] != '\n') {
                if (n > 1024) {
                    state_ = kError;
                    return false;
                }
                continue;
            }

            std::string line = chunkLineBuf_.substr(0, n - 2);
            chunkLineBuf_.clear();
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            line = TrimWs(line);
            char* endp = nullptr;
            const unsigned long long size = std::strtoull(line.c_str(), &endp, 16);
            if (line.empty() || endp == line.c_str()) {
                state_ = kError;
                return false;
            }
            chunkRemaining_ = static_cast<size_t>(size);
            expectingChunkSize_ = false;
            if (chunkRemaining_ == 0) trailer_ = true;
            continue;
        }

        if (chunkRemaining_ > 0) {
            const size_t take = std::min(chunkRemaining_, avail);
            body_.append(p, take);
            chunkRemaining_ -= take;
            off += take;
            if (chunkRemaining_ == 0) chunkCrlfRemaining_ = 2;
            continue;
        }

        if (chunkCrlfRemaining_ > 0) {
            const char expect = (chunkCrlfRemaining_ == 2) ? '\r' : '\n';
            if (p[0] != expect) {
                state_ = kError;
                return false;
            }
            --chunkCrlfRemaining_;
            ++off;
            if (chunkCrlfRemaining_ == 0) expectingChunkSize_ = true;
            continue;
        }

        state_ = kError;
        return false;
    }
    return state_ != kError;
}

bool HttpResponseParser::ConsumeBody(const char* data, size_t len) {
    if (chunked_) return ConsumeChunked(data, len);
    if (untilClose_) {
        body_.append(data, len);
        return true;
    }
    const size_t take = std::min(bodyRemaining_, len);
    body_.append(data, take);
    bodyRemaining_ -= take;
    if (bodyRemaining_ == 0) state_ = kGotAll;
    return true;
}

bool HttpResponseParser::Feed(const char* data, size_t len) {
    if (state_ == kError || state_ == kGotAll) return state_ == kGotAll;
    if (!data || len == 0) return false;

    if (state_ == kExpectHeaders) {
        headerBuf_.append(data, len);
        const size_t hdrPos = headerBuf_.find("\r\n\r\n");
        if (hdrPos == std::string::npos) return false;

        const size_t headerEnd = hdrPos + 4;
        const std::string headerBlock = headerBuf_.substr(0, headerEnd);
        const std::string bodyPart = headerBuf_.substr(headerEnd);
        headerBuf_.clear();

        if (!ParseHeaderBlock(headerBlock)) return false;
        if (state_ == kExpectBody && !bodyPart.empty()) {
            ConsumeBody(bodyPart.data(), bodyPart.size());
        }
        return state_ == kGotAll;
    }

    ConsumeBody(data, len);
    return state_ == kGotAll;
}

bool HttpResponseParser::Finish() {
    if (state_ == kExpectBody && untilClose_) state_ = kGotAll;
    if (state_ != kGotAll && state_ != kError) state_ = kError;
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace wrapmgr
