#include "core/paths.h"

#include <filesystem>

namespace omnote
{
namespace fs = std::filesystem;

std::string AppPaths::StatePath() const
{
    return (fs::path(config_dir) / "state.json").string();
}

std::string AppPaths::LegacyStatePath() const
{
    return (fs::path(config_home) / "micropad" / "state.json").string();
}

std::string AppPaths::AutosaveDir() const
{
    return (fs::path(cache_dir) / "autosave").string();
}

std::string AppPaths::DebugLogPath() const
{
    return (fs::path(cache_dir) / "debug.log").string();
}

AppPaths ResolveAppPaths(const Environment& env)
{
    AppPaths p;
    p.home_dir = EnvOrEmpty(env, "HOME");
    if (p.home_dir.empty())
        p.home_dir = ".";

    const std::string xdg_config = EnvOrEmpty(env, "XDG_CONFIG_HOME");
    p.config_home = !xdg_config.empty() ? xdg_config : (fs::path(p.home_dir) / ".config").string();

    const std::string xdg_cache = EnvOrEmpty(env, "XDG_CACHE_HOME");
    p.cache_home = !xdg_cache.empty() ? xdg_cache : (fs::path(p.home_dir) / ".cache").string();

    p.config_dir = (fs::path(p.config_home) / "omnote").string();
    p.cache_dir = (fs::path(p.cache_home) / "omnote").string();
    return p;
}

AppPaths AppPathsUnder(const std::string& root)
{
    Environment env;
    env["HOME"] = root;
    return ResolveAppPaths(env);
}

std::string ExpandUser(const std::string& path, const std::string& home_dir)
{
    if (path.empty() || path[0] != '~')
        return path;
    if (path.size() == 1)
        return home_dir;
    if (path[1] != '/')
        return path; // "~user" is not supported
    return (fs::path(home_dir) / path.substr(2)).string();
}
} // namespace omnote
