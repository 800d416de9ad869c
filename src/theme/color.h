#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace omnote::theme
{
struct Rgb8
{
    std::uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

// Every color slot a source can supply.
enum class ColorKey : std::uint8_t
{
    Background = 0,
    Foreground,
    Accent,
    Cursor,
    SelectionBackground,
    SelectionForeground,
    Color0, // ANSI palette, color0..color15 are contiguous
    Color15 = Color0 + 15,
};

static constexpr std::size_t kColorKeyCount = (std::size_t)ColorKey::Color15 + 1;
static constexpr std::size_t kAnsiColorCount = 16;

inline ColorKey AnsiKey(int index)
{
    return (ColorKey)((int)ColorKey::Color0 + index);
}

// "background", "foreground", "accent", "cursor", "selection_background",
// "selection_foreground", "color0".."color15".
std::string ColorKeyName(ColorKey k);
std::optional<ColorKey> ColorKeyFromName(std::string_view name);

// Lenient color value parser. Accepts (surrounding quotes and whitespace ignored):
//   #rrggbb, #rrggbbaa (alpha dropped), 0xrrggbb, rgb:rr/gg/bb, rrggbb
std::optional<Rgb8> ParseColorValue(std::string_view s);

// "#rrggbb", lowercase.
std::string ToHex(const Rgb8& c);

// Linear blend: t=0 -> a, t=1 -> b.
Rgb8 Mix(const Rgb8& a, const Rgb8& b, float t);

// Colors extracted from one source. Unset slots mean "this source did not say",
// never black.
struct PartialPalette
{
    std::array<std::optional<Rgb8>, kColorKeyCount> slots = {};

    // Other config files this one pulls in (Alacritty `import`), in declaration order.
    // Paths are as written in the file (may start with "~" or be relative).
    std::vector<std::string> imports;

    // Values for known keys that could not be parsed as colors (skipped individually).
    size_t skipped_values = 0;

    bool Has(ColorKey k) const { return slots[(size_t)k].has_value(); }
    const std::optional<Rgb8>& Get(ColorKey k) const { return slots[(size_t)k]; }
    void Set(ColorKey k, const Rgb8& c) { slots[(size_t)k] = c; }

    size_t CountSet() const;
    bool Empty() const { return CountSet() == 0; }

    // Background + foreground at minimum.
    bool IsUsable() const { return Has(ColorKey::Background) && Has(ColorKey::Foreground); }

    // Copies every slot `top` has set over this palette's slot.
    void OverlayFrom(const PartialPalette& top);
};
} // namespace omnote::theme
