#include "wrapmgr/protocol/WorkerWire.h"
#include "wrapmgr/common/Logger.h"

#include <cassert>
#include <string>

using namespace wrapmgr::protocol;

int main() {
    wrapmgr::common::Logger::Instance().SetLevel(wrapmgr::common::LogLevel::INFO);

    // Handshake: [u8 len][adam][u8 len][key]
    {
        std::string out;
        assert(wire::EncodeDecryptHandshake("1440", "skd://k", &out));
        assert(out.size() == 1 + 4 + 1 + 7);
        assert(static_cast<unsigned char>(out[0]) == 4);
        assert(out.substr(1, 4) == "1440");
        assert(static_cast<unsigned char>(out[5]) == 7);
        assert(out.substr(6) == "skd://k");
    }

    // 255 bytes is the last length that fits.
    {
        std::string out = "untouched";
        assert(wire::EncodeDecryptHandshake(std::string(255, 'a'), "k", &out));
        assert(static_cast<unsigned char>(out[0]) == 255);
        out = "untouched";
        assert(!wire::EncodeDecryptHandshake(std::string(256, 'a'), "k", &out));
        assert(!wire::EncodeDecryptHandshake("a", std::string(256, 'k'), &out));
        assert(out == "untouched");
        assert(!wire::EncodeM3u8Request(std::string(300, 'x'), &out));
    }

    // Sample length is little-endian.
    {
        const std::string sample(0x0102, 's');
        const std::string framed = wire::EncodeSample(sample);
        assert(framed.size() == sample.size() + 4);
        assert(static_cast<unsigned char>(framed[0]) == 0x02);
        assert(static_cast<unsigned char>(framed[1]) == 0x01);
        assert(framed[2] == 0 && framed[3] == 0);
        assert(wire::EncodeSample(std::string()).size() == 4);
    }

    // M3U8 reply lines
    {
        std::string url;
        assert(wire::ParseM3u8Line("https://a.example/x.m3u8\n", &url));
        assert(url == "https://a.example/x.m3u8");
        assert(wire::ParseM3u8Line("  http://b.example/y.m3u8\r\n", &url));
        assert(url == "http://b.example/y.m3u8");
        assert(!wire::ParseM3u8Line("\n", &url));
        assert(!wire::ParseM3u8Line("", &url));
        assert(!wire::ParseM3u8Line("error: not found\n", &url));
        assert(!wire::ParseM3u8Line("ftp://c.example/z\n", &url));
    }

    LOG_INFO << "WorkerWire: PASS";
    return 0;
}
