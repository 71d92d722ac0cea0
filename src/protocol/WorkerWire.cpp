#include "wrapmgr/protocol/WorkerWire.h"

namespace wrapmgr {
namespace protocol {
namespace wire {

bool AppendField(const std::string& field, std::string* out) {
    if (field.size() > kMaxFieldLength) return false;
    out->push_back(static_cast<char>(static_cast<uint8_t>(field.size())));
    out->append(field);
    return true;
}

bool EncodeDecryptHandshake(const std::string& adamId, const std::string& key, std::string* out) {
    std::string buf;
    buf.reserve(adamId.size() + key.size() + 2);
    if (!AppendField(adamId, &buf) || !AppendField(key, &buf)) return false;
    *out = std::move(buf);
    return true;
}

bool EncodeM3u8Request(const std::string& adamId, std::string* out) {
    std::string buf;
    if (!AppendField(adamId, &buf)) return false;
    *out = std::move(buf);
    return true;
}

std::string EncodeSample(const std::string& sample) {
    const uint32_t len = static_cast<uint32_t>(sample.size());
    std::string out;
    out.reserve(sample.size() + 4);
    out.push_back(static_cast<char>(len & 0xff));
    out.push_back(static_cast<char>((len >> 8) & 0xff));
    out.push_back(static_cast<char>((len >> 16) & 0xff));
    out.push_back(static_cast<char>((len >> 24) & 0xff));
    out.append(sample);
    return out;
}

bool ParseM3u8Line(const std::string& line, std::string* url) {
    size_t b = 0;
    size_t e = line.size();
    while (b < e && (line[b] == ' ' || line[b] == '\t' || line[b] == '\r' || line[b] == '\n')) ++b;
    while (e > b && (line[e - 1] == ' ' || line[e - 1] == '\t' || line[e - 1] == '\r' || line[e - 1] == '\n')) --e;
    if (e == b) return false;
    const std::string trimmed = line.substr(b, e - b);
    if (trimmed.compare(0, 4, "http") != 0) return false;
    *url = trimmed;
    return true;
}

} // namespace wire
} // namespace protocol
} // namespace wrapmgr
