#include "test_helpers.h"

#include "theme/source_parsers.h"
#include "theme/theme_resolver.h"

using namespace omnote;
using namespace omnote::theme;
using omnote::test::TempDir;
using omnote::test::WriteText;

namespace
{
struct ResolverFixture
{
    TempDir home;
    AppPaths paths = AppPathsUnder(home.path.string());
    Environment env{{"HOME", home.path.string()}};

    std::string Cfg(const std::string& rel) const { return paths.config_home + "/" + rel; }

    ThemeSpec Resolve(bool force_system = false) const
    {
        return ResolveTheme(SourceRegistry::BuildDefault(paths, env), env, force_system);
    }
};

static const char* kKitty = "background #101010\nforeground #a0a0a0\ncolor4 #0000aa\n";
static const char* kFoot = "[colors]\nbackground=202020\nforeground=b0b0b0\n";
} // namespace

TEST_CASE("No sources gives the system default", "[resolver]")
{
    ResolverFixture fx;
    const ThemeSpec s = fx.Resolve();
    CHECK(s.mode == ThemeMode::System);
    CHECK(s.source_id == "system-gtk");
    CHECK(ToHex(s.background) == "#1e1e1e");
    CHECK(ToHex(s.foreground) == "#e0e0e0");
}

TEST_CASE("First usable source in priority order wins", "[resolver]")
{
    ResolverFixture fx;
    WriteText(fx.Cfg("foot/foot.ini"), kFoot);

    SECTION("only foot")
    {
        const ThemeSpec s = fx.Resolve();
        CHECK(s.mode == ThemeMode::Live);
        CHECK(s.source_id == "foot");
        CHECK(ToHex(s.background) == "#202020");
    }

    SECTION("kitty outranks foot")
    {
        WriteText(fx.Cfg("kitty/kitty.conf"), kKitty);
        const ThemeSpec s = fx.Resolve();
        CHECK(s.source_id == "kitty");
        CHECK(ToHex(s.background) == "#101010");
        // accent <- color4 when the source has no accent or cursor
        CHECK(ToHex(s.accent) == "#0000aa");
    }

    SECTION("alacritty outranks kitty")
    {
        WriteText(fx.Cfg("kitty/kitty.conf"), kKitty);
        WriteText(fx.Cfg("alacritty/alacritty.toml"),
                  "[colors.primary]\nbackground = \"#303030\"\nforeground = \"#c0c0c0\"\n");
        CHECK(fx.Resolve().source_id == "alacritty");
    }

    SECTION("omarchy theme outranks everything")
    {
        WriteText(fx.Cfg("kitty/kitty.conf"), kKitty);
        WriteText(fx.Cfg("omarchy/current/theme/kitty.conf"), "background #404040\nforeground #d0d0d0\n");
        const ThemeSpec s = fx.Resolve();
        CHECK(s.source_id == "omarchy");
        CHECK(ToHex(s.background) == "#404040");
    }

    SECTION("a source without background/foreground is skipped")
    {
        WriteText(fx.Cfg("alacritty/alacritty.toml"), "[window]\nopacity = 0.8\n");
        WriteText(fx.Cfg("kitty/kitty.conf"), "foreground #ffffff\n");
        CHECK(fx.Resolve().source_id == "foot");
    }
}

TEST_CASE("Alacritty imports apply beneath the importing file", "[resolver][alacritty]")
{
    ResolverFixture fx;
    WriteText(fx.Cfg("alacritty/themes/base.toml"),
              "[colors.primary]\nbackground = \"#111111\"\nforeground = \"#222222\"\n"
              "[colors.normal]\nred = \"#aa0000\"\n");
    WriteText(fx.Cfg("alacritty/alacritty.toml"),
              "[general]\nimport = [\"themes/base.toml\", \"~/missing.toml\"]\n"
              "[colors.primary]\nforeground = \"#eeeeee\"\n");

    const ThemeSpec s = fx.Resolve();
    CHECK(s.source_id == "alacritty");
    CHECK(ToHex(s.background) == "#111111");
    CHECK(ToHex(s.foreground) == "#eeeeee");
    CHECK(ToHex(s.palette[1]) == "#aa0000");
}

TEST_CASE("Import cycles and depth are bounded", "[resolver][alacritty]")
{
    ResolverFixture fx;

    SECTION("cycle")
    {
        WriteText(fx.Cfg("alacritty/a.toml"), "import = [\"b.toml\"]\n[colors.primary]\nbackground = \"#010101\"\n");
        WriteText(fx.Cfg("alacritty/b.toml"), "import = [\"a.toml\"]\n[colors.primary]\nforeground = \"#020202\"\n");
        WriteText(fx.Cfg("alacritty/alacritty.toml"), "import = [\"a.toml\"]\n");

        const ThemeSpec s = fx.Resolve();
        CHECK(s.source_id == "alacritty");
        CHECK(ToHex(s.background) == "#010101");
        CHECK(ToHex(s.foreground) == "#020202");
    }

    SECTION("chain longer than the limit is cut")
    {
        // alacritty.toml -> l1 -> ... -> l9; only l9 has colors, beyond depth 8.
        WriteText(fx.Cfg("alacritty/alacritty.toml"), "import = [\"l1.toml\"]\n");
        for (int i = 1; i < 9; ++i)
            WriteText(fx.Cfg("alacritty/l" + std::to_string(i) + ".toml"),
                      "import = [\"l" + std::to_string(i + 1) + ".toml\"]\n");
        WriteText(fx.Cfg("alacritty/l9.toml"), "[colors.primary]\nbackground = \"#010101\"\nforeground = \"#020202\"\n");

        CHECK(fx.Resolve().source_id == "system-gtk");

        PartialPalette p;
        ErrorKind kind = ErrorKind::SourceUnavailable;
        std::string err;
        REQUIRE(LoadConfigFile(ParserKind::Alacritty, fx.Cfg("alacritty/l1.toml"), fx.paths.home_dir, p, kind, err));
        CHECK(p.IsUsable());
    }
}

TEST_CASE("Environment overrides are applied per key", "[resolver][env]")
{
    ResolverFixture fx;
    WriteText(fx.Cfg("kitty/kitty.conf"), kKitty);

    fx.env["OMNOTE_BG"] = "#000001";
    fx.env["MICROPAD_FG"] = "#000002";
    fx.env["OMNOTE_CARET"] = "#000003";
    fx.env["OMNOTE_COLOR15"] = "0x0000ff";
    fx.env["OMNOTE_SEL_BG"] = "not-a-color";

    ThemeSpec s = fx.Resolve();
    CHECK(s.source_id == "kitty");
    CHECK(s.mode == ThemeMode::Live);
    CHECK(ToHex(s.background) == "#000001");
    CHECK(ToHex(s.foreground) == "#000002");
    CHECK(ToHex(s.cursor) == "#000003");
    CHECK(ToHex(s.palette[15]) == "#0000ff");
    // Untouched keys come from kitty.
    CHECK(ToHex(s.palette[4]) == "#0000aa");

    SECTION("OMNOTE_* beats MICROPAD_*")
    {
        fx.env["OMNOTE_FG"] = "#000004";
        CHECK(ToHex(fx.Resolve().foreground) == "#000004");
    }

    SECTION("CURSOR beats CARET")
    {
        fx.env["OMNOTE_CURSOR"] = "#000005";
        CHECK(ToHex(fx.Resolve().cursor) == "#000005");
    }
}

TEST_CASE("Environment colors act as a source of their own", "[resolver][env]")
{
    ResolverFixture fx;
    fx.env["OMNOTE_BG"] = "#0a0a0a";

    SECTION("background alone keeps the system mode")
    {
        const ThemeSpec s = fx.Resolve();
        CHECK(s.mode == ThemeMode::System);
        CHECK(ToHex(s.background) == "#0a0a0a");
    }

    SECTION("background and foreground make it live")
    {
        fx.env["MICROPAD_FG"] = "#fafafa";
        const ThemeSpec s = fx.Resolve();
        CHECK(s.mode == ThemeMode::Live);
        CHECK(s.source_id == "environment");
    }
}

TEST_CASE("Forced system mode ignores sources and overrides", "[resolver]")
{
    ResolverFixture fx;
    WriteText(fx.Cfg("kitty/kitty.conf"), kKitty);
    fx.env["OMNOTE_BG"] = "#000001";

    const ThemeSpec s = fx.Resolve(true);
    CHECK(s.mode == ThemeMode::ForcedSystem);
    CHECK(s.source_id == "system-gtk");
    CHECK(ToHex(s.background) == "#1e1e1e");
}

TEST_CASE("Resolution is deterministic", "[resolver]")
{
    ResolverFixture fx;
    WriteText(fx.Cfg("foot/foot.ini"), kFoot);
    WriteText(fx.Cfg("kitty/current-theme.conf"), "background #121212\nforeground #343434\n");
    const ThemeSpec a = fx.Resolve();
    const ThemeSpec b = fx.Resolve();
    CHECK(a == b);
    CHECK(a.source_id == "kitty-theme");
}
