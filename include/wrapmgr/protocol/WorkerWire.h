#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wrapmgr {
namespace protocol {

// Framing spoken by a decryption worker on its decrypt and M3U8 ports.
//
// Decrypt port, one connection per key:
//   -> [u8 adamLen][adamId][u8 keyLen][key]
//   then per sample:
//   -> [u32 LE sampleLen][sample]
//   <- sampleLen bytes of plaintext
//
// M3U8 port:
//   -> [u8 adamLen][adamId]
//   <- one '\n'-terminated line, an http(s) URL on success
namespace wire {

const size_t kMaxFieldLength = 255;

// Length-prefixed field; false if the field does not fit in one byte.
bool AppendField(const std::string& field, std::string* out);

bool EncodeDecryptHandshake(const std::string& adamId, const std::string& key, std::string* out);
bool EncodeM3u8Request(const std::string& adamId, std::string* out);

// [u32 LE length][bytes]
std::string EncodeSample(const std::string& sample);

// Validates one reply line from the M3U8 port. On success *url holds the
// trimmed URL; anything empty or not starting with "http" is rejected.
bool ParseM3u8Line(const std::string& line, std::string* url);

} // namespace wire
} // namespace protocol
} // namespace wrapmgr
