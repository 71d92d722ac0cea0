#include "wrapmgr/common/JsonLite.h"

#include <cstdint>
#include <cstdio>

namespace wrapmgr {
namespace common {
namespace json {

namespace {

const int kMaxDepth = 64;

bool SkipString(const std::string& s, size_t* p) {
    if (*p >= s.size() || s[*p] != '"') return false;
    size_t i = *p + 1;
    while (i < s.size()) {
        const char c = s[i];
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c == '"') {
            *p = i + 1;
            return true;
        }
        ++i;
    }
    return false;
}

bool SkipValueDepth(const std::string& s, size_t* p, int depth) {
    if (depth > kMaxDepth) return false;
    SkipSpaces(s, p);
    if (*p >= s.size()) return false;

    const char c = s[*p];
    if (c == '"') return SkipString(s, p);

    if (c == '{' || c == '[') {
        const char close = (c == '{') ? '}' : ']';
        ++*p;
        SkipSpaces(s, p);
        if (*p < s.size() && s[*p] == close) {
            ++*p;
            return true;
        }
        while (*p < s.size()) {
            if (c == '{') {
                if (!SkipString(s, p)) return false;
                SkipSpaces(s, p);
                if (*p >= s.size() || s[*p] != ':') return false;
                ++*p;
            }
            if (!SkipValueDepth(s, p, depth + 1)) return false;
            SkipSpaces(s, p);
            if (*p >= s.size()) return false;
            if (s[*p] == ',') {
                ++*p;
                SkipSpaces(s, p);
                continue;
            }
            if (s[*p] == close) {
                ++*p;
                return true;
            }
            return false;
        }
        return false;
    }

    // Literal or number: run until a structural character.
    const size_t start = *p;
    while (*p < s.size()) {
        const char d = s[*p];
        if (d == ',' || d == '}' || d == ']' || d == ' ' || d == '\t' || d == '\r' || d == '\n') break;
        ++*p;
    }
    return *p > start;
}

void AppendUtf8(uint32_t cp, std::string* out) {
    if (cp < 0x80) {
        out->push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool ParseHex4(const std::string& s, size_t p, uint32_t* out) {
    if (p + 4 > s.size()) return false;
    uint32_t v = 0;
    for (size_t i = p; i < p + 4; ++i) {
        const char c = s[i];
        v <<= 4;
        if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    *out = v;
    return true;
}

bool IsIndex(const std::string& seg) {
    if (seg.empty()) return false;
    for (char c : seg) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

void SkipSpaces(const std::string& s, size_t* p) {
    while (*p < s.size() && (s[*p] == ' ' || s[*p] == '\t' || s[*p] == '\r' || s[*p] == '\n')) ++*p;
}

bool SkipValue(const std::string& s, size_t* p) {
    return SkipValueDepth(s, p, 0);
}

bool Root(const std::string& s, size_t* valuePos) {
    size_t p = 0;
    SkipSpaces(s, &p);
    if (p >= s.size()) return false;
    *valuePos = p;
    return true;
}

bool FindMember(const std::string& s, size_t objPos, const std::string& key, size_t* valuePos) {
    size_t p = objPos;
    SkipSpaces(s, &p);
    if (p >= s.size() || s[p] != '{') return false;
    ++p;
    while (true) {
        SkipSpaces(s, &p);
        if (p >= s.size()) return false;
        if (s[p] == '}') return false;

        std::string name;
        const size_t nameStart = p;
        if (!SkipString(s, &p)) return false;
        if (!ParseString(s, nameStart, &name)) return false;

        SkipSpaces(s, &p);
        if (p >= s.size() || s[p] != ':') return false;
        ++p;
        SkipSpaces(s, &p);

        if (name == key) {
            *valuePos = p;
            return p < s.size();
        }
        if (!SkipValue(s, &p)) return false;
        SkipSpaces(s, &p);
        if (p < s.size() && s[p] == ',') {
            ++p;
            continue;
        }
        return false;
    }
}

bool ArrayElement(const std::string& s, size_t arrPos, size_t index, size_t* valuePos) {
    size_t p = arrPos;
    SkipSpaces(s, &p);
    if (p >= s.size() || s[p] != '[') return false;
    ++p;
    SkipSpaces(s, &p);
    if (p < s.size() && s[p] == ']') return false;

    for (size_t i = 0;; ++i) {
        SkipSpaces(s, &p);
        if (i == index) {
            *valuePos = p;
            return p < s.size();
        }
        if (!SkipValue(s, &p)) return false;
        SkipSpaces(s, &p);
        if (p >= s.size() || s[p] != ',') return false;
        ++p;
    }
}

bool FindPath(const std::string& s, const std::vector<std::string>& path, size_t* valuePos) {
    size_t p = 0;
    if (!Root(s, &p)) return false;
    for (const auto& seg : path) {
        size_t next = 0;
        if (p < s.size() && s[p] == '[' && IsIndex(seg)) {
            if (!ArrayElement(s, p, static_cast<size_t>(std::stoul(seg)), &next)) return false;
        } else if (!FindMember(s, p, seg, &next)) {
            return false;
        }
        p = next;
    }
    *valuePos = p;
    return true;
}

bool ParseString(const std::string& s, size_t p, std::string* out) {
    SkipSpaces(s, &p);
    if (p >= s.size() || s[p] != '"') return false;
    ++p;
    std::string v;
    while (p < s.size()) {
        const char c = s[p++];
        if (c == '"') {
            *out = std::move(v);
            return true;
        }
        if (c != '\\') {
            v.push_back(c);
            continue;
        }
        if (p >= s.size()) return false;
        const char e = s[p++];
        switch (e) {
            case '"': v.push_back('"'); break;
            case '\\': v.push_back('\\'); break;
            case '/': v.push_back('/'); break;
            case 'b': v.push_back('\b'); break;
            case 'f': v.push_back('\f'); break;
            case 'n': v.push_back('\n'); break;
            case 'r': v.push_back('\r'); break;
            case 't': v.push_back('\t'); break;
            case 'u': {
                uint32_t cp = 0;
                if (!ParseHex4(s, p, &cp)) return false;
                p += 4;
                if (cp >= 0xD800 && cp <= 0xDBFF && p + 6 <= s.size() && s[p] == '\\' && s[p + 1] == 'u') {
                    uint32_t lo = 0;
                    if (ParseHex4(s, p + 2, &lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        p += 6;
                    }
                }
                AppendUtf8(cp, &v);
                break;
            }
            default:
                return false;
        }
    }
    return false;
}

bool GetString(const std::string& s, const std::string& key, std::string* out) {
    size_t root = 0;
    size_t p = 0;
    if (!Root(s, &root)) return false;
    if (!FindMember(s, root, key, &p)) return false;
    return ParseString(s, p, out);
}

bool IsNull(const std::string& s, size_t p) {
    SkipSpaces(s, &p);
    return s.compare(p, 4, "null") == 0;
}

std::string Escape(const std::string& in) {
    std::string out;
    out.reserve(in.size() + 8);
    for (unsigned char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof buf, "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

} // namespace json
} // namespace common
} // namespace wrapmgr
