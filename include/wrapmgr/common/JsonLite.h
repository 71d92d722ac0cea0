#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wrapmgr {
namespace common {
namespace json {

// Minimal JSON navigation over the raw text. Positions are byte offsets into
// the document; a "value position" points at the first non-space character of
// a value. Nothing is materialized except the strings that are asked for.

void SkipSpaces(const std::string& s, size_t* p);

// Advances *p past one complete value (object, array, string, literal, number).
bool SkipValue(const std::string& s, size_t* p);

// Position of the document's root value.
bool Root(const std::string& s, size_t* valuePos);

// Looks up a direct member of the object starting at objPos.
bool FindMember(const std::string& s, size_t objPos, const std::string& key, size_t* valuePos);

// Looks up element `index` of the array starting at arrPos.
bool ArrayElement(const std::string& s, size_t arrPos, size_t index, size_t* valuePos);

// Follows a path like {"data", "0", "attributes"}: numeric segments index arrays.
bool FindPath(const std::string& s, const std::vector<std::string>& path, size_t* valuePos);

// Decodes the string value at p, including \uXXXX escapes (emitted as UTF-8).
bool ParseString(const std::string& s, size_t p, std::string* out);

// Convenience: string member of the root object.
bool GetString(const std::string& s, const std::string& key, std::string* out);

bool IsNull(const std::string& s, size_t p);

// Escapes a string for embedding in JSON output (without surrounding quotes).
std::string Escape(const std::string& in);

} // namespace json
} // namespace common
} // namespace wrapmgr
