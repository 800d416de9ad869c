#include "theme/theme_spec.h"

#include <utility>

namespace omnote::theme
{
const char* ThemeModeName(ThemeMode m)
{
    switch (m)
    {
    case ThemeMode::Live: return "live";
    case ThemeMode::System: return "system";
    case ThemeMode::ForcedSystem: return "forced-system";
    }
    return "system";
}

std::optional<ThemeMode> ThemeModeFromName(std::string_view name)
{
    if (name == "live")
        return ThemeMode::Live;
    if (name == "system")
        return ThemeMode::System;
    if (name == "forced-system")
        return ThemeMode::ForcedSystem;
    return std::nullopt;
}

bool ThemeSpec::SameAppearance(const ThemeSpec& o) const
{
    return mode == o.mode &&
           background == o.background &&
           foreground == o.foreground &&
           accent == o.accent &&
           cursor == o.cursor &&
           selection_background == o.selection_background &&
           selection_foreground == o.selection_foreground &&
           palette == o.palette;
}

PartialPalette SystemDefaultPalette()
{
    // xterm defaults, ANSI/SGR order.
    static const Rgb8 kXterm16[kAnsiColorCount] = {
        {0x00, 0x00, 0x00}, // 0 black
        {0xcd, 0x00, 0x00}, // 1 red
        {0x00, 0xcd, 0x00}, // 2 green
        {0xcd, 0xcd, 0x00}, // 3 yellow
        {0x00, 0x00, 0xee}, // 4 blue
        {0xcd, 0x00, 0xcd}, // 5 magenta
        {0x00, 0xcd, 0xcd}, // 6 cyan
        {0xe5, 0xe5, 0xe5}, // 7 white
        {0x7f, 0x7f, 0x7f}, // 8 bright black
        {0xff, 0x00, 0x00}, // 9 bright red
        {0x00, 0xff, 0x00}, // 10 bright green
        {0xff, 0xff, 0x00}, // 11 bright yellow
        {0x5c, 0x5c, 0xff}, // 12 bright blue
        {0xff, 0x00, 0xff}, // 13 bright magenta
        {0x00, 0xff, 0xff}, // 14 bright cyan
        {0xff, 0xff, 0xff}, // 15 bright white
    };

    PartialPalette p;
    p.Set(ColorKey::Background, Rgb8{0x1e, 0x1e, 0x1e});
    p.Set(ColorKey::Foreground, Rgb8{0xe0, 0xe0, 0xe0});
    p.Set(ColorKey::Accent, Rgb8{0x35, 0x84, 0xe4}); // GTK accent blue
    for (int i = 0; i < (int)kAnsiColorCount; ++i)
        p.Set(AnsiKey(i), kXterm16[i]);
    return p;
}

ThemeSpec CompleteThemeSpec(const PartialPalette& p, std::string source_id, ThemeMode mode)
{
    const PartialPalette defaults = SystemDefaultPalette();
    auto pick = [&](ColorKey k) -> Rgb8 {
        if (p.Has(k))
            return *p.Get(k);
        return defaults.Get(k).value_or(Rgb8{});
    };

    ThemeSpec s;
    s.background = pick(ColorKey::Background);
    s.foreground = pick(ColorKey::Foreground);
    for (int i = 0; i < (int)kAnsiColorCount; ++i)
        s.palette[(size_t)i] = pick(AnsiKey(i));

    s.cursor = p.Has(ColorKey::Cursor) ? *p.Get(ColorKey::Cursor) : s.foreground;

    if (p.Has(ColorKey::Accent))
        s.accent = *p.Get(ColorKey::Accent);
    else if (p.Has(ColorKey::Cursor))
        s.accent = *p.Get(ColorKey::Cursor);
    else if (p.Has(AnsiKey(4)))
        s.accent = *p.Get(AnsiKey(4));
    else
        s.accent = pick(ColorKey::Accent);

    s.selection_background = p.Has(ColorKey::SelectionBackground)
                                 ? *p.Get(ColorKey::SelectionBackground)
                                 : Mix(s.background, s.foreground, 0.15f);
    s.selection_foreground = p.Has(ColorKey::SelectionForeground)
                                 ? *p.Get(ColorKey::SelectionForeground)
                                 : s.foreground;

    s.source_id = std::move(source_id);
    s.mode = mode;
    return s;
}

std::string DescribeThemeSpec(const ThemeSpec& spec)
{
    return std::string(ThemeModeName(spec.mode)) + " from '" + spec.source_id + "' bg=" + ToHex(spec.background) +
           " fg=" + ToHex(spec.foreground) + " accent=" + ToHex(spec.accent);
}
} // namespace omnote::theme
