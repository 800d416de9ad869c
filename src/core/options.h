#pragma once

#include "core/environment.h"

#include <chrono>
#include <string>

namespace omnote
{
// Timing contracts of the subsystem. Defaults are the production values; tests shrink them.
struct Timings
{
    // Source watcher: trailing debounce window, and the cap measured from the first event
    // of a burst so a steady trickle of writes still triggers a resolution.
    std::chrono::milliseconds watch_debounce{250};
    std::chrono::milliseconds watch_max_latency{1000};

    // Polling fallback period when inotify is unavailable.
    std::chrono::milliseconds watch_poll_interval{2000};

    // Autosave: write after this much idle time, but never later than max_latency after the
    // first unsaved edit.
    std::chrono::milliseconds autosave_idle{2000};
    std::chrono::milliseconds autosave_max_latency{30000};

    // Periodic session state save (only when something changed or a write failed).
    std::chrono::milliseconds state_save_interval{30000};

    // Orphaned autosave records older than this are purged at startup.
    std::chrono::milliseconds autosave_retention{std::chrono::hours(24 * 7)};
};

// What the core needs to know from argv + environment.
struct RuntimeOptions
{
    bool force_system_theme = false; // --system-theme / OMNOTE_THEME_MODE=system
    bool watch_enabled = true;       // cleared by --no-watch / OMNOTE_NO_WATCH=1
    bool debug = false;              // OMNOTE_DEBUG: echo the debug log to stderr
    bool show_help = false;
    Timings timings;
};

// Reads OMNOTE_THEME_MODE / OMNOTE_NO_WATCH / OMNOTE_DEBUG (and their MICROPAD_* aliases).
void ApplyEnvironmentOptions(const Environment& env, RuntimeOptions& out);

// Parses argv on top of the environment-derived options.
// Accepts --system-theme, --no-watch, -h/--help. Anything else is an error.
bool ParseCommandLine(int argc, const char* const* argv, const Environment& env, RuntimeOptions& out, std::string& err);

void PrintUsage(const char* argv0);
} // namespace omnote
