#include "wrapmgr/protocol/HttpResponseParser.h"
#include "wrapmgr/common/Logger.h"

#include <cassert>
#include <algorithm>
#include <cstring>
#include <string>

using wrapmgr::protocol::HttpResponseParser;

static bool FeedAll(HttpResponseParser* p, const std::string& s, size_t step) {
    bool done = false;
    for (size_t off = 0; off < s.size(); off += step) {
        done = p->Feed(s.data() + off, std::min(step, s.size() - off));
    }
    return done;
}

int main() {
    wrapmgr::common::Logger::Instance().SetLevel(wrapmgr::common::LogLevel::INFO);

    // Content-Length, fed one byte at a time.
    {
        HttpResponseParser p;
        const std::string resp =
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: 17\r\n"
            "\r\n"
            "{\"dev_token\":\"x\"}";
        assert(FeedAll(&p, resp, 1));
        assert(p.gotAll());
        assert(p.statusCode() == 200);
        assert(p.body() == "{\"dev_token\":\"x\"}");
        assert(p.header("content-type") == "application/json");
        assert(p.header("CONTENT-LENGTH") == "17");
        assert(p.header("x-missing").empty());
    }

    // Chunked body with a trailer-less terminator.
    {
        HttpResponseParser p;
        const std::string resp =
            "HTTP/1.1 401 Unauthorized\r\n"
            "Transfer-Encoding: chunked\r\n"
            "\r\n"
            "5\r\nhello\r\n"
            "6\r\n world\r\n"
            "0\r\n\r\n";
        assert(FeedAll(&p, resp, 7));
        assert(p.statusCode() == 401);
        assert(p.body() == "hello world");
    }

    // Close-delimited body completes on Finish().
    {
        HttpResponseParser p;
        const std::string resp = "HTTP/1.0 200 OK\r\n\r\npartial body";
        assert(!FeedAll(&p, resp, 64));
        assert(!p.gotAll());
        assert(p.Finish());
        assert(p.body() == "partial body");
    }

    // A Content-Length body cut short is an error, not a success.
    {
        HttpResponseParser p;
        const std::string resp = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";
        assert(!FeedAll(&p, resp, 64));
        assert(!p.Finish());
        assert(p.hasError());
    }

    // Garbage status line.
    {
        HttpResponseParser p;
        const std::string resp = "NOT-HTTP\r\n\r\n";
        FeedAll(&p, resp, 64);
        assert(p.hasError());
    }

    // Request builder.
    {
        const std::string req = HttpResponseParser::BuildGet("127.0.0.1:30020", "/account", {{"Accept", "application/json"}});
        assert(req.compare(0, 27, "GET /account HTTP/1.1\r\nHost") == 0);
        assert(req.find("Host: 127.0.0.1:30020\r\n") != std::string::npos);
        assert(req.find("Accept: application/json\r\n") != std::string::npos);
        assert(req.find("Connection: close\r\n") != std::string::npos);
        assert(req.size() >= 4 && req.compare(req.size() - 4, 4, "\r\n\r\n") == 0);
    }

    LOG_INFO << "HttpResponseParser: PASS";
    return 0;
}
