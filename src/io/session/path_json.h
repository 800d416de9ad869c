#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

// File paths inside the session document and autosave sidecars.
//
// Linux file names are bytes, JSON strings are UTF-8. A path that is valid UTF-8 is stored as
// a plain string under <key>. Otherwise <key> holds a display copy (bad bytes become U+FFFD)
// and <key>_bytes holds the exact bytes as lowercase hex; readers prefer <key>_bytes.
namespace path_json
{
using json = nlohmann::json;

bool IsValidUtf8(std::string_view s);

// Replaces each byte that does not start a valid UTF-8 sequence with U+FFFD.
std::string ToDisplayUtf8(std::string_view s);

// An empty path is written as null.
void WritePath(json& o, const char* key, const std::string& path);

// Absent or null leaves `out` untouched.
bool ReadPath(const json& o, const char* key, std::string& out, std::string& err);
} // namespace path_json
