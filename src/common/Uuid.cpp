#include "wrapmgr/common/Uuid.h"
#include "wrapmgr/common/Logger.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdint>

namespace wrapmgr {
namespace common {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool ParseUuid(const std::string& s, uint8_t out[16]) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '-') continue;
        if (n >= 32 || i + 1 >= s.size()) return false;
        const int hi = HexValue(s[i]);
        const int lo = HexValue(s[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[n / 2] = static_cast<uint8_t>((hi << 4) | lo);
        n += 2;
        ++i;
    }
    return n == 32;
}

std::string FormatUuid(const uint8_t b[16]) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[b[i] >> 4]);
        out.push_back(kHex[b[i] & 0x0f]);
    }
    return out;
}

} // namespace

std::string Uuid5(const std::string& namespaceUuid, const std::string& name) {
    uint8_t ns[16];
    if (!ParseUuid(namespaceUuid, ns)) {
        LOG_ERROR << "Uuid5: malformed namespace " << namespaceUuid;
        return std::string();
    }

    std::string input(reinterpret_cast<const char*>(ns), sizeof ns);
    input += name;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha1(), nullptr) != 1 || digestLen < 16) {
        LOG_ERROR << "Uuid5: SHA-1 digest failed";
        return std::string();
    }

    uint8_t b[16];
    for (int i = 0; i < 16; ++i) b[i] = digest[i];
    b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x50);
    b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);
    return FormatUuid(b);
}

std::string Uuid4() {
    uint8_t b[16];
    if (RAND_bytes(b, sizeof b) != 1) {
        LOG_ERROR << "Uuid4: RAND_bytes failed";
        return std::string();
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);
    return FormatUuid(b);
}

} // namespace common
} // namespace wrapmgr
