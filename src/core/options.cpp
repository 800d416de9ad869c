#include "core/options.h"

#include <cctype>
#include <cstdio>
#include <string_view>

namespace omnote
{
static std::string Lower(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

void ApplyEnvironmentOptions(const Environment& env, RuntimeOptions& out)
{
    // OMNOTE_* wins; MICROPAD_* is only consulted when the new name is unset.
    std::string mode = EnvOrEmpty(env, "OMNOTE_THEME_MODE");
    if (mode.empty())
        mode = EnvOrEmpty(env, "MICROPAD_THEME_MODE");
    if (Lower(mode) == "system")
        out.force_system_theme = true;

    const bool has_new_no_watch = !EnvOrEmpty(env, "OMNOTE_NO_WATCH").empty();
    if (has_new_no_watch ? EnvFlag(env, "OMNOTE_NO_WATCH") : EnvFlag(env, "MICROPAD_NO_WATCH"))
        out.watch_enabled = false;

    if (!EnvOrEmpty(env, "OMNOTE_DEBUG").empty() || !EnvOrEmpty(env, "MICROPAD_DEBUG").empty())
        out.debug = true;
}

bool ParseCommandLine(int argc, const char* const* argv, const Environment& env, RuntimeOptions& out, std::string& err)
{
    err.clear();
    ApplyEnvironmentOptions(env, out);

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i] ? argv[i] : "";
        if (arg == "--system-theme")
            out.force_system_theme = true;
        else if (arg == "--no-watch")
            out.watch_enabled = false;
        else if (arg == "-h" || arg == "--help")
            out.show_help = true;
        else
        {
            err = "Unrecognized argument: " + std::string(arg);
            return false;
        }
    }
    return true;
}

void PrintUsage(const char* argv0)
{
    std::fprintf(stderr,
                 "Usage: %s [--system-theme] [--no-watch]\n"
                 "\n"
                 "Options:\n"
                 "  --system-theme  Use the system GTK theme (ignore terminal palettes and overrides)\n"
                 "  --no-watch      Do not watch theme sources for changes\n"
                 "  -h, --help      Show this help\n"
                 "\n"
                 "Environment:\n"
                 "  OMNOTE_THEME_MODE=system, OMNOTE_NO_WATCH=1, OMNOTE_DEBUG=1\n"
                 "  OMNOTE_BG, OMNOTE_FG, OMNOTE_ACCENT, OMNOTE_CURSOR, OMNOTE_SEL_BG, OMNOTE_SEL_FG,\n"
                 "  OMNOTE_COLOR0..OMNOTE_COLOR15 (legacy MICROPAD_* names are also accepted)\n",
                 argv0 ? argv0 : "omnote");
}
} // namespace omnote
