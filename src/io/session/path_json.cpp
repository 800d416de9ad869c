#include "io/session/path_json.h"

#include <utility>

namespace path_json
{
// Length of the UTF-8 sequence starting at s[i], or 0 if it is not well-formed
// (overlong forms, surrogates and code points past U+10FFFF included).
static size_t Utf8SequenceLength(std::string_view s, size_t i)
{
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char c = byte(i);
    if (c < 0x80)
        return 1;

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF)
        len = 2;
    else if (c >= 0xE0 && c <= 0xEF)
    {
        len = 3;
        if (c == 0xE0)
            lo = 0xA0;
        else if (c == 0xED)
            hi = 0x9F;
    }
    else if (c >= 0xF0 && c <= 0xF4)
    {
        len = 4;
        if (c == 0xF0)
            lo = 0x90;
        else if (c == 0xF4)
            hi = 0x8F;
    }
    else
        return 0;

    if (i + len > s.size())
        return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi)
        return 0;
    for (size_t k = 2; k < len; ++k)
    {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF)
            return 0;
    }
    return len;
}

bool IsValidUtf8(std::string_view s)
{
    size_t i = 0;
    while (i < s.size())
    {
        const size_t n = Utf8SequenceLength(s, i);
        if (n == 0)
            return false;
        i += n;
    }
    return true;
}

std::string ToDisplayUtf8(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size())
    {
        const size_t n = Utf8SequenceLength(s, i);
        if (n == 0)
        {
            out += "\xEF\xBF\xBD";
            ++i;
            continue;
        }
        out.append(s.substr(i, n));
        i += n;
    }
    return out;
}

static std::string HexEncode(std::string_view s)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() * 2);
    for (char ch : s)
    {
        const unsigned char c = static_cast<unsigned char>(ch);
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0F]);
    }
    return out;
}

static int HexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

static bool HexDecode(std::string_view hex, std::string& out)
{
    if (hex.size() % 2 != 0)
        return false;
    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const int hi = HexValue(hex[i]);
        const int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return false;
        bytes.push_back(static_cast<char>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

void WritePath(json& o, const char* key, const std::string& path)
{
    if (path.empty())
    {
        o[key] = nullptr;
        return;
    }
    if (IsValidUtf8(path))
    {
        o[key] = path;
        return;
    }
    o[key] = ToDisplayUtf8(path);
    o[std::string(key) + "_bytes"] = HexEncode(path);
}

bool ReadPath(const json& o, const char* key, std::string& out, std::string& err)
{
    const std::string bytes_key = std::string(key) + "_bytes";
    if (o.contains(bytes_key) && !o[bytes_key].is_null())
    {
        if (!o[bytes_key].is_string() || !HexDecode(o[bytes_key].get<std::string>(), out))
        {
            err = "'" + bytes_key + "' must be a hex string";
            return false;
        }
        return true;
    }

    if (!o.contains(key) || o[key].is_null())
        return true;
    if (!o[key].is_string())
    {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = o[key].get<std::string>();
    return true;
}
} // namespace path_json
