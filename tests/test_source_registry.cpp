#include "test_helpers.h"

#include "theme/source_registry.h"

#include <algorithm>

using namespace omnote;
using namespace omnote::theme;
using omnote::test::TempDir;
using omnote::test::WriteText;
namespace fs = std::filesystem;

static std::vector<std::string> Ids(const SourceRegistry& r)
{
    std::vector<std::string> ids;
    for (const auto& d : r.Descriptors())
        ids.push_back(d.id);
    return ids;
}

TEST_CASE("Default registry order", "[registry]")
{
    TempDir home;
    const AppPaths paths = AppPathsUnder(home.path.string());
    Environment env{{"HOME", home.path.string()}};

    const SourceRegistry r = SourceRegistry::BuildDefault(paths, env);
    const std::vector<std::string> expect = {"omarchy", "alacritty", "alacritty-yml", "alacritty-yaml",
                                             "alacritty-home", "kitty", "kitty-theme", "foot",
                                             "environment", "system-gtk"};
    CHECK(Ids(r) == expect);

    const auto& d = r.Descriptors();
    for (size_t i = 1; i < d.size(); ++i)
        CHECK(d[i - 1].priority_rank < d[i].priority_rank);

    CHECK(d.front().parser_kind == ParserKind::OmarchyThemeDir);
    CHECK(d.front().filesystem_path == paths.config_home + "/omarchy/current/theme");
    CHECK(d[1].filesystem_path == paths.config_home + "/alacritty/alacritty.toml");
    CHECK(d[4].filesystem_path == home.path.string() + "/.alacritty.yml");
    CHECK(d.back().parser_kind == ParserKind::SystemGtk);
    CHECK(d.back().filesystem_path.empty());
}

TEST_CASE("ALACRITTY_CONFIG is the first Alacritty candidate", "[registry]")
{
    TempDir home;
    const AppPaths paths = AppPathsUnder(home.path.string());
    Environment env{{"HOME", home.path.string()}, {"ALACRITTY_CONFIG", "~/dotfiles/alacritty.toml"}};

    const SourceRegistry r = SourceRegistry::BuildDefault(paths, env);
    REQUIRE(r.Descriptors().size() > 2);
    CHECK(r.Descriptors()[1].id == "alacritty-env");
    CHECK(r.Descriptors()[1].parser_kind == ParserKind::Alacritty);
    CHECK(r.Descriptors()[1].filesystem_path == home.path.string() + "/dotfiles/alacritty.toml");
}

TEST_CASE("Registry watch paths cover theme selection inputs", "[registry]")
{
    TempDir home;
    const AppPaths paths = AppPathsUnder(home.path.string());
    const SourceRegistry r = SourceRegistry::BuildDefault(paths, Environment{});

    const auto w = r.WatchPaths();
    auto has = [&](const std::string& p) { return std::find(w.begin(), w.end(), p) != w.end(); };
    CHECK(has(paths.config_home + "/kitty/kitty.conf"));
    CHECK(has(paths.config_home + "/foot/foot.ini"));
    CHECK(has(paths.config_home + "/hypr/hyprland.conf"));
    CHECK(has(paths.config_home + "/omarchy/current-theme"));
    CHECK(std::find(w.begin(), w.end(), std::string()) == w.end());

    std::vector<std::string> sorted = w;
    std::sort(sorted.begin(), sorted.end());
    CHECK(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end());
}

TEST_CASE("Duplicate ranks are made strict in declaration order", "[registry]")
{
    SourceRegistry r({
        {"b", "/b", ParserKind::Kitty, 5},
        {"a", "/a", ParserKind::Alacritty, 1},
        {"c", "/c", ParserKind::Foot, 5},
    });
    CHECK(Ids(r) == std::vector<std::string>{"a", "b", "c"});
    CHECK(r.Descriptors()[1].priority_rank == 5);
    CHECK(r.Descriptors()[2].priority_rank == 6);
}

TEST_CASE("Omarchy theme directory detection", "[registry][omarchy]")
{
    TempDir home;
    const std::string cfg = home / ".config";

    SECTION("nothing installed")
    {
        CHECK(DetectOmarchyThemeDir(cfg).empty());
    }

    SECTION("current/theme directory")
    {
        fs::create_directories(home.path / ".config/omarchy/current/theme");
        CHECK(DetectOmarchyThemeDir(cfg) == cfg + "/omarchy/current/theme");
    }

    SECTION("marker file names the theme")
    {
        fs::create_directories(home.path / ".config/omarchy/themes/tokyo-night");
        WriteText(home / ".config/omarchy/current-theme", "tokyo-night\n");
        CHECK(DetectOmarchyThemeDir(cfg) == cfg + "/omarchy/themes/tokyo-night");
    }

    SECTION("marker naming a missing theme is ignored")
    {
        WriteText(home / ".config/omarchy/theme", "gone\n");
        CHECK(DetectOmarchyThemeDir(cfg).empty());
    }

    SECTION("hyprland.conf source line")
    {
        fs::create_directories(home.path / ".config/omarchy/themes/everforest");
        WriteText(home / ".config/hypr/hyprland.conf",
                  "# appearance\n"
                  "source = ~/.config/hypr/monitors.conf\n"
                  "source = ~/.config/omarchy/themes/everforest/hyprland.conf\n");
        CHECK(DetectOmarchyThemeDir(cfg) == cfg + "/omarchy/themes/everforest");
    }

    SECTION("detected directory becomes the omarchy source")
    {
        fs::create_directories(home.path / ".config/omarchy/themes/nord");
        WriteText(home / ".config/omarchy/selected-theme", "nord");
        const SourceRegistry r = SourceRegistry::BuildDefault(AppPathsUnder(home.path.string()), Environment{});
        CHECK(r.Descriptors().front().filesystem_path == cfg + "/omarchy/themes/nord");
    }
}
