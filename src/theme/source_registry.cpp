#include "theme/source_registry.h"

#include "io/file_io.h"
#include "io/formats/config_text.h"

#include <algorithm>
#include <filesystem>

namespace omnote::theme
{
namespace fs = std::filesystem;
namespace ct = formats::config_text;

const char* ParserKindName(ParserKind k)
{
    switch (k)
    {
    case ParserKind::OmarchyThemeDir: return "omarchy";
    case ParserKind::Alacritty: return "alacritty";
    case ParserKind::Kitty: return "kitty";
    case ParserKind::Foot: return "foot";
    case ParserKind::Environment: return "environment";
    case ParserKind::SystemGtk: return "system-gtk";
    }
    return "unknown";
}

SourceRegistry::SourceRegistry(std::vector<SourceDescriptor> descriptors, std::vector<std::string> extra_watch_paths)
    : descriptors_(std::move(descriptors)),
      extra_watch_paths_(std::move(extra_watch_paths))
{
    std::stable_sort(descriptors_.begin(), descriptors_.end(), [](const SourceDescriptor& a, const SourceDescriptor& b) {
        return a.priority_rank < b.priority_rank;
    });
    for (size_t i = 1; i < descriptors_.size(); ++i)
    {
        if (descriptors_[i].priority_rank <= descriptors_[i - 1].priority_rank)
            descriptors_[i].priority_rank = descriptors_[i - 1].priority_rank + 1;
    }
}

std::vector<std::string> SourceRegistry::WatchPaths() const
{
    std::vector<std::string> out;
    auto add = [&](const std::string& p) {
        if (!p.empty() && std::find(out.begin(), out.end(), p) == out.end())
            out.push_back(p);
    };
    for (const auto& d : descriptors_)
        add(d.filesystem_path);
    for (const auto& p : extra_watch_paths_)
        add(p);
    return out;
}

static bool IsDir(const fs::path& p)
{
    std::error_code ec;
    return fs::is_directory(p, ec);
}

static std::string ThemeNameFromHyprland(const std::string& text)
{
    // source = ~/.local/share/omarchy/themes/<name>/hyprland.conf
    for (std::string_view line : ct::SplitLines(text))
    {
        line = ct::TrimAscii(line);
        if (line.empty() || line.front() == '#')
            continue;
        const size_t eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;
        const std::string key = ct::Lower(ct::TrimAscii(line.substr(0, eq)));
        if (key != "source" && key != "include")
            continue;
        const std::string_view value = ct::TrimAscii(line.substr(eq + 1));
        if (value.find("omarchy/") == std::string_view::npos)
            continue;
        const std::string_view suffix = "/hyprland.conf";
        if (value.size() <= suffix.size() || value.substr(value.size() - suffix.size()) != suffix)
            continue;
        const std::string_view dir = value.substr(0, value.size() - suffix.size());
        const size_t themes = dir.rfind("/themes/");
        if (themes == std::string_view::npos)
            continue;
        const std::string_view name = dir.substr(themes + 8);
        if (!name.empty() && name.find('/') == std::string_view::npos)
            return std::string(name);
    }
    return std::string();
}

std::string DetectOmarchyThemeDir(const std::string& config_home)
{
    const fs::path omarchy = fs::path(config_home) / "omarchy";
    const fs::path themes = omarchy / "themes";

    const fs::path current = omarchy / "current" / "theme";
    if (IsDir(current))
        return current.string();

    const fs::path themes_current = themes / "current";
    if (IsDir(themes_current))
    {
        std::error_code ec;
        const fs::path resolved = fs::canonical(themes_current, ec);
        return ec ? themes_current.string() : resolved.string();
    }

    for (const char* marker : {"current-theme", "theme", "selected-theme"})
    {
        std::string text, err;
        const fs::path m = omarchy / marker;
        std::error_code ec;
        if (!fs::is_regular_file(m, ec))
            continue;
        if (!file_io::ReadFileText(m.string(), text, err, 4096))
            continue;
        const std::string name(ct::TrimAscii(text));
        if (name.empty() || name.find('/') != std::string::npos)
            continue;
        if (IsDir(themes / name))
            return (themes / name).string();
    }

    std::string hypr, err;
    if (file_io::ReadFileText((fs::path(config_home) / "hypr" / "hyprland.conf").string(), hypr, err, 1024 * 1024))
    {
        const std::string name = ThemeNameFromHyprland(hypr);
        if (!name.empty() && IsDir(themes / name))
            return (themes / name).string();
    }
    return std::string();
}

SourceRegistry SourceRegistry::BuildDefault(const AppPaths& paths, const Environment& env)
{
    const fs::path cfg(paths.config_home);
    std::vector<SourceDescriptor> d;
    int rank = 0;
    auto add = [&](std::string id, std::string path, ParserKind kind) {
        d.push_back(SourceDescriptor{std::move(id), std::move(path), kind, rank++});
    };

    std::string omarchy = DetectOmarchyThemeDir(paths.config_home);
    if (omarchy.empty())
        omarchy = (cfg / "omarchy" / "current" / "theme").string();
    add("omarchy", omarchy, ParserKind::OmarchyThemeDir);

    const std::string alacritty_env = EnvOrEmpty(env, "ALACRITTY_CONFIG");
    if (!alacritty_env.empty())
        add("alacritty-env", ExpandUser(alacritty_env, paths.home_dir), ParserKind::Alacritty);
    add("alacritty", (cfg / "alacritty" / "alacritty.toml").string(), ParserKind::Alacritty);
    add("alacritty-yml", (cfg / "alacritty" / "alacritty.yml").string(), ParserKind::Alacritty);
    add("alacritty-yaml", (cfg / "alacritty" / "alacritty.yaml").string(), ParserKind::Alacritty);
    add("alacritty-home", (fs::path(paths.home_dir) / ".alacritty.yml").string(), ParserKind::Alacritty);

    add("kitty", (cfg / "kitty" / "kitty.conf").string(), ParserKind::Kitty);
    add("kitty-theme", (cfg / "kitty" / "current-theme.conf").string(), ParserKind::Kitty);

    add("foot", (cfg / "foot" / "foot.ini").string(), ParserKind::Foot);

    add("environment", std::string(), ParserKind::Environment);
    add("system-gtk", std::string(), ParserKind::SystemGtk);

    // Inputs of DetectOmarchyThemeDir(): a change there can move the Omarchy source.
    std::vector<std::string> extra = {
        (cfg / "omarchy" / "current-theme").string(),
        (cfg / "omarchy" / "theme").string(),
        (cfg / "omarchy" / "selected-theme").string(),
        (cfg / "omarchy" / "current" / "theme").string(),
        (cfg / "hypr" / "hyprland.conf").string(),
    };
    return SourceRegistry(std::move(d), std::move(extra));
}
} // namespace omnote::theme
