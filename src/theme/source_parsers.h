#pragma once

#include "core/environment.h"
#include "core/error.h"
#include "theme/color.h"
#include "theme/source_registry.h"

#include <string>
#include <string_view>

namespace omnote::theme
{
// Import chains deeper than this are cut off (and logged).
static constexpr int kMaxImportDepth = 8;

// Dispatches to the text reader for `kind` (Alacritty, Kitty or Foot).
// Other kinds are not text formats and fail with err.
bool ParseSourceText(ParserKind kind, std::string_view text, PartialPalette& out, std::string& err);

// Reads one config file plus everything it imports. Imports are applied first and the
// file's own keys override them; a later import overrides an earlier one.
// `home_dir` expands "~" in import paths; relative imports are resolved against the
// importing file's directory. Broken imports are skipped.
//
// On failure `kind` says whether the file was missing/unreadable or unusable.
bool LoadConfigFile(ParserKind parser,
                    const std::string& path,
                    const std::string& home_dir,
                    PartialPalette& out,
                    ErrorKind& kind,
                    std::string& err);

// Loads whatever `desc` points at: a config file, or an Omarchy theme directory (first
// usable of alacritty.toml, alacritty.yaml, alacritty.yml, kitty.conf, foot.ini).
// The Environment kind reads color variables from `env`. SystemGtk always succeeds with
// the built-in default palette.
//
// Succeeds only when the result is usable (background + foreground).
bool LoadSourcePalette(const SourceDescriptor& desc,
                       const Environment& env,
                       PartialPalette& out,
                       ErrorKind& kind,
                       std::string& err);

// Color variables from the environment: MICROPAD_<KEY>, overridden by OMNOTE_<KEY>, where
// KEY is BG, FG, ACCENT, CURSOR (or CARET), SEL_BG, SEL_FG, COLOR0..COLOR15.
// Unparsable values are skipped and counted.
PartialPalette EnvironmentColors(const Environment& env);
} // namespace omnote::theme
