#pragma once

#include "theme/color.h"

#include <string>
#include <string_view>

// foot.ini color reader.
//
//   include=~/.config/foot/theme.ini   (main section; returned as an import)
//   [colors]                            ([colors-dark] is accepted too)
//   background=1e1e2e
//   foreground=cdd6f4
//   regular0..regular7=rrggbb           -> color0..color7
//   bright0..bright7=rrggbb             -> color8..color15
//   selection-background=rrggbb
//   selection-foreground=rrggbb
//   cursor=<text> <cursor>              (second color is the cursor)
//   [cursor]
//   color=<text> <cursor>
namespace omnote::formats::foot
{
bool ParseColors(std::string_view text, theme::PartialPalette& out, std::string& err);
} // namespace omnote::formats::foot
