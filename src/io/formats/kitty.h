#pragma once

#include "theme/color.h"

#include <string>
#include <string_view>

// kitty.conf color reader.
//
//   # comment
//   background            #1e1e2e
//   foreground            #cdd6f4
//   cursor                #f5e0dc
//   selection_background  #f5e0dc
//   selection_foreground  #1e1e2e
//   active_border_color   #b4befe      (used as the accent)
//   color0 .. color15     #rrggbb
//   include current-theme.conf         (returned as an import)
namespace omnote::formats::kitty
{
bool ParseColors(std::string_view text, theme::PartialPalette& out, std::string& err);
} // namespace omnote::formats::kitty
