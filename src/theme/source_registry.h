#pragma once

#include "core/environment.h"
#include "core/paths.h"

#include <string>
#include <vector>

namespace omnote::theme
{
enum class ParserKind
{
    OmarchyThemeDir, // directory holding alacritty.toml / kitty.conf / foot.ini
    Alacritty,
    Kitty,
    Foot,
    Environment,     // OMNOTE_* / MICROPAD_* variables acting as a source of their own
    SystemGtk,       // built-in fallback; always usable
};

const char* ParserKindName(ParserKind k);

// One known external configuration source.
struct SourceDescriptor
{
    std::string id;              // stable id, reported as ThemeSpec::source_id
    std::string filesystem_path; // empty for Environment / SystemGtk
    ParserKind  parser_kind = ParserKind::SystemGtk;
    int         priority_rank = 0; // lower wins; strictly increasing across the registry
};

// Ordered, immutable list of sources.
//
// Precedence: Omarchy theme > Alacritty > Kitty > Foot > environment > system GTK fallback.
class SourceRegistry
{
public:
    SourceRegistry() = default;

    // Sorts by priority_rank. Duplicate ranks are reassigned in the given order so the
    // resulting order is strict.
    SourceRegistry(std::vector<SourceDescriptor> descriptors, std::vector<std::string> extra_watch_paths = {});

    const std::vector<SourceDescriptor>& Descriptors() const { return descriptors_; }

    // Every path worth watching: descriptor paths plus the inputs used to locate them
    // (Omarchy marker files, hyprland.conf).
    std::vector<std::string> WatchPaths() const;

    // The standard registry for a user: ~/.config based terminal configs, $ALACRITTY_CONFIG,
    // and the currently selected Omarchy theme.
    static SourceRegistry BuildDefault(const AppPaths& paths, const Environment& env);

private:
    std::vector<SourceDescriptor> descriptors_;
    std::vector<std::string> extra_watch_paths_;
};

// Locates the active Omarchy theme directory under <config_home>/omarchy:
//   1. current/theme (symlink or directory)
//   2. themes/current (symlink)
//   3. a theme name read from current-theme, theme or selected-theme -> themes/<name>
//   4. a `source = .../omarchy/.../themes/<name>/hyprland.conf` line in hypr/hyprland.conf
// Returns an empty string when none of these lead to an existing directory.
std::string DetectOmarchyThemeDir(const std::string& config_home);
} // namespace omnote::theme
