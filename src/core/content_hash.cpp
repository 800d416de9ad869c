#include "core/content_hash.h"

#include <blake3.h>

#include <array>
#include <cstdint>

namespace omnote
{
std::string ContentHashHex(std::string_view data)
{
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    if (!data.empty())
        blake3_hasher_update(&hasher, data.data(), data.size());

    std::array<std::uint8_t, 16> out = {};
    blake3_hasher_finalize(&hasher, out.data(), out.size());

    static const char* k = "0123456789abcdef";
    std::string hex;
    hex.resize(out.size() * 2);
    for (size_t i = 0; i < out.size(); ++i)
    {
        hex[i * 2 + 0] = k[(out[i] >> 4) & 0xFu];
        hex[i * 2 + 1] = k[out[i] & 0xFu];
    }
    return hex;
}
} // namespace omnote
