#pragma once

#include "core/environment.h"

#include <string>

namespace omnote
{
// Directory layout used by omnote.
//
// Built once at startup from the environment (XDG base dirs, then $HOME), or pointed at a
// scratch directory by tests. All members are absolute paths without a trailing slash.
struct AppPaths
{
    std::string home_dir;     // $HOME
    std::string config_home;  // $XDG_CONFIG_HOME, else $HOME/.config
    std::string cache_home;   // $XDG_CACHE_HOME, else $HOME/.cache
    std::string config_dir;   // <config_home>/omnote
    std::string cache_dir;    // <cache_home>/omnote

    // <config_dir>/state.json
    std::string StatePath() const;

    // <config_home>/micropad/state.json (pre-rename location, read once for migration)
    std::string LegacyStatePath() const;

    // <cache_dir>/autosave
    std::string AutosaveDir() const;

    // <cache_dir>/debug.log
    std::string DebugLogPath() const;
};

// Resolves the directory layout from environment variables.
// Falls back to the current directory when neither XDG vars nor $HOME are set.
AppPaths ResolveAppPaths(const Environment& env);

// Lays everything out under `root` as if it were $HOME (root/.config, root/.cache).
AppPaths AppPathsUnder(const std::string& root);

// Expands a leading "~" or "~/" against `home_dir`. Other paths are returned unchanged.
std::string ExpandUser(const std::string& path, const std::string& home_dir);
} // namespace omnote
