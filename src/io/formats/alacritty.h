#pragma once

#include "theme/color.h"

#include <string>
#include <string_view>

// Alacritty configuration color reader (TOML, plus the legacy YAML format).
//
// Sketch of what is read:
//   [colors.primary]            colors:
//   background = "#1e1e2e"        primary:
//   foreground = "#cdd6f4"          background: '0x1e1e2e'
//   [colors.normal]                 foreground: '0xcdd6f4'
//   black = "#45475a"  ...        normal: { black: ..., red: ..., ... }
//   [colors.bright] ...           bright: ...
//   [colors.cursor] cursor = ..   cursor: { cursor: ... }
//   [colors.selection]            selection: { background: ..., text: ... }
//   import = ["themes/x.toml"]    import:
//   [general] import = [...]        - ~/.config/alacritty/x.yml
//
// This is not a TOML/YAML parser: it tracks tables/indentation well enough to locate the
// color keys and skips everything else.
namespace omnote::formats::alacritty
{
// Returns false (with err) when the text has neither a usable color key nor an import.
// Individual malformed values are skipped and counted in out.skipped_values.
bool ParseColors(std::string_view text, theme::PartialPalette& out, std::string& err);
} // namespace omnote::formats::alacritty
