#pragma once

#include <string>
#include <string_view>

namespace omnote
{
// BLAKE3 truncated to 128 bits, lowercase hex (32 chars).
// Used to content-address autosave snapshots so unchanged buffers are not rewritten.
std::string ContentHashHex(std::string_view data);
} // namespace omnote
