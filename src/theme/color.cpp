#include "theme/color.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace omnote::theme
{
namespace
{
static const char* kFixedKeyNames[] = {
    "background",
    "foreground",
    "accent",
    "cursor",
    "selection_background",
    "selection_foreground",
};

static std::string_view TrimAscii(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

static int Nyb(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

static int ByteAt(std::string_view s, size_t i)
{
    const int hi = Nyb(s[i + 0]);
    const int lo = Nyb(s[i + 1]);
    if (hi < 0 || lo < 0)
        return -1;
    return (hi << 4) | lo;
}

static std::optional<Rgb8> ParseHexDigits(std::string_view s)
{
    // RRGGBB or RRGGBBAA (alpha ignored).
    if (s.size() != 6 && s.size() != 8)
        return std::nullopt;
    for (char c : s)
        if (Nyb(c) < 0)
            return std::nullopt;
    Rgb8 out;
    out.r = (std::uint8_t)ByteAt(s, 0);
    out.g = (std::uint8_t)ByteAt(s, 2);
    out.b = (std::uint8_t)ByteAt(s, 4);
    return out;
}
} // namespace

std::string ColorKeyName(ColorKey k)
{
    const size_t i = (size_t)k;
    if (i < (size_t)ColorKey::Color0)
        return kFixedKeyNames[i];
    return "color" + std::to_string(i - (size_t)ColorKey::Color0);
}

std::optional<ColorKey> ColorKeyFromName(std::string_view name)
{
    for (size_t i = 0; i < (size_t)ColorKey::Color0; ++i)
    {
        if (name == kFixedKeyNames[i])
            return (ColorKey)i;
    }
    if (name.size() >= 6 && name.substr(0, 5) == "color")
    {
        const std::string_view digits = name.substr(5);
        if (digits.empty() || digits.size() > 2)
            return std::nullopt;
        int v = 0;
        for (char c : digits)
        {
            if (c < '0' || c > '9')
                return std::nullopt;
            v = v * 10 + (c - '0');
        }
        if (v < 0 || v >= (int)kAnsiColorCount)
            return std::nullopt;
        return AnsiKey(v);
    }
    return std::nullopt;
}

std::optional<Rgb8> ParseColorValue(std::string_view s)
{
    s = TrimAscii(s);
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        s = TrimAscii(s.substr(1, s.size() - 2));
    if (s.empty())
        return std::nullopt;

    if (s[0] == '#')
        return ParseHexDigits(s.substr(1));

    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
        return ParseHexDigits(s.substr(2));

    if (s.size() > 4 && s.substr(0, 4) == "rgb:")
    {
        // X11 style rgb:rr/gg/bb
        const std::string_view body = s.substr(4);
        if (body.size() != 8 || body[2] != '/' || body[5] != '/')
            return std::nullopt;
        const int r = ByteAt(body, 0);
        const int g = ByteAt(body, 3);
        const int b = ByteAt(body, 6);
        if (r < 0 || g < 0 || b < 0)
            return std::nullopt;
        return Rgb8{(std::uint8_t)r, (std::uint8_t)g, (std::uint8_t)b};
    }

    // Foot writes bare hex.
    return ParseHexDigits(s);
}

std::string ToHex(const Rgb8& c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", (int)c.r, (int)c.g, (int)c.b);
    return std::string(buf);
}

Rgb8 Mix(const Rgb8& a, const Rgb8& b, float t)
{
    auto ch = [t](std::uint8_t x, std::uint8_t y) -> std::uint8_t {
        const float v = std::round((float)x * (1.0f - t) + (float)y * t);
        return (std::uint8_t)std::clamp(v, 0.0f, 255.0f);
    };
    return Rgb8{ch(a.r, b.r), ch(a.g, b.g), ch(a.b, b.b)};
}

size_t PartialPalette::CountSet() const
{
    size_t n = 0;
    for (const auto& s : slots)
        if (s)
            ++n;
    return n;
}

void PartialPalette::OverlayFrom(const PartialPalette& top)
{
    for (size_t i = 0; i < kColorKeyCount; ++i)
    {
        if (top.slots[i])
            slots[i] = top.slots[i];
    }
}
} // namespace omnote::theme
