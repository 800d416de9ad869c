#include "test_helpers.h"

#include "core/options.h"
#include "core/paths.h"

using namespace omnote;

TEST_CASE("Command line options", "[options]")
{
    RuntimeOptions opt;
    std::string err;

    SECTION("defaults")
    {
        const char* argv[] = {"omnote"};
        REQUIRE(ParseCommandLine(1, argv, Environment{}, opt, err));
        CHECK_FALSE(opt.force_system_theme);
        CHECK(opt.watch_enabled);
        CHECK_FALSE(opt.show_help);
        CHECK(opt.timings.autosave_idle == std::chrono::milliseconds(2000));
    }

    SECTION("flags")
    {
        const char* argv[] = {"omnote", "--system-theme", "--no-watch", "-h"};
        REQUIRE(ParseCommandLine(4, argv, Environment{}, opt, err));
        CHECK(opt.force_system_theme);
        CHECK_FALSE(opt.watch_enabled);
        CHECK(opt.show_help);
    }

    SECTION("unknown argument")
    {
        const char* argv[] = {"omnote", "--frobnicate"};
        CHECK_FALSE(ParseCommandLine(2, argv, Environment{}, opt, err));
        CHECK(err.find("--frobnicate") != std::string::npos);
    }
}

TEST_CASE("Environment options", "[options]")
{
    RuntimeOptions opt;

    SECTION("new names")
    {
        ApplyEnvironmentOptions({{"OMNOTE_THEME_MODE", "System"}, {"OMNOTE_NO_WATCH", "yes"}, {"OMNOTE_DEBUG", "1"}}, opt);
        CHECK(opt.force_system_theme);
        CHECK_FALSE(opt.watch_enabled);
        CHECK(opt.debug);
    }

    SECTION("legacy names")
    {
        ApplyEnvironmentOptions({{"MICROPAD_THEME_MODE", "system"}, {"MICROPAD_NO_WATCH", "1"}}, opt);
        CHECK(opt.force_system_theme);
        CHECK_FALSE(opt.watch_enabled);
    }

    SECTION("new names win over legacy ones")
    {
        ApplyEnvironmentOptions({{"OMNOTE_THEME_MODE", "live"},
                                 {"MICROPAD_THEME_MODE", "system"},
                                 {"OMNOTE_NO_WATCH", "0"},
                                 {"MICROPAD_NO_WATCH", "1"}},
                                opt);
        CHECK_FALSE(opt.force_system_theme);
        CHECK(opt.watch_enabled);
    }
}

TEST_CASE("Application paths", "[options][paths]")
{
    SECTION("XDG variables")
    {
        const AppPaths p = ResolveAppPaths({{"HOME", "/home/u"}, {"XDG_CONFIG_HOME", "/cfg"}, {"XDG_CACHE_HOME", "/cache"}});
        CHECK(p.StatePath() == "/cfg/omnote/state.json");
        CHECK(p.LegacyStatePath() == "/cfg/micropad/state.json");
        CHECK(p.AutosaveDir() == "/cache/omnote/autosave");
    }

    SECTION("home fallback")
    {
        const AppPaths p = ResolveAppPaths({{"HOME", "/home/u"}});
        CHECK(p.config_dir == "/home/u/.config/omnote");
        CHECK(p.cache_dir == "/home/u/.cache/omnote");
    }

    SECTION("tilde expansion")
    {
        CHECK(ExpandUser("~", "/home/u") == "/home/u");
        CHECK(ExpandUser("~/a/b", "/home/u") == "/home/u/a/b");
        CHECK(ExpandUser("/abs", "/home/u") == "/abs");
        CHECK(ExpandUser("~other/x", "/home/u") == "~other/x");
    }
}
