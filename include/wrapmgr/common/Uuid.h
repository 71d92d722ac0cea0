#pragma once

#include <string>

namespace wrapmgr {
namespace common {

// Name-based UUID (RFC 4122 version 5, SHA-1). namespaceUuid must be in
// canonical 8-4-4-4-12 form; returns an empty string if it is malformed.
std::string Uuid5(const std::string& namespaceUuid, const std::string& name);

// Random UUID (version 4). Returns an empty string if the RNG fails.
std::string Uuid4();

} // namespace common
} // namespace wrapmgr
