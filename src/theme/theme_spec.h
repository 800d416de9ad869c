#pragma once

#include "theme/color.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace omnote::theme
{
enum class ThemeMode
{
    Live,         // a terminal/theme source (or the environment) supplied the palette
    System,       // nothing usable was found; system GTK defaults (overrides still apply)
    ForcedSystem, // --system-theme / OMNOTE_THEME_MODE=system; sources and overrides ignored
};

const char* ThemeModeName(ThemeMode m); // "live", "system", "forced-system"
std::optional<ThemeMode> ThemeModeFromName(std::string_view name);

// The resolved palette the UI applies. Treated as an immutable value: an update replaces the
// whole spec.
struct ThemeSpec
{
    Rgb8 background;
    Rgb8 foreground;
    Rgb8 accent;
    Rgb8 cursor;
    Rgb8 selection_background;
    Rgb8 selection_foreground;
    std::array<Rgb8, kAnsiColorCount> palette = {};

    std::string source_id; // SourceDescriptor id of the winning source
    ThemeMode mode = ThemeMode::System;

    // Colors + mode; the source id is not compared.
    bool SameAppearance(const ThemeSpec& o) const;

    bool operator==(const ThemeSpec& o) const { return SameAppearance(o) && source_id == o.source_id; }
    bool operator!=(const ThemeSpec& o) const { return !(*this == o); }
};

// Palette used when no source is usable (and for forced-system mode): the system GTK
// default look (#1e1e1e on #e0e0e0) with the xterm 16-color palette.
PartialPalette SystemDefaultPalette();

// Builds a complete spec from a (possibly partial) palette:
// - unset keys come from SystemDefaultPalette();
// - accent falls back to the source's cursor, then its color4;
// - cursor falls back to the foreground;
// - selection background is a 15% blend of background toward foreground;
// - selection foreground falls back to the foreground.
ThemeSpec CompleteThemeSpec(const PartialPalette& p, std::string source_id, ThemeMode mode);

// Human readable one-liner for the debug log.
std::string DescribeThemeSpec(const ThemeSpec& spec);
} // namespace omnote::theme
