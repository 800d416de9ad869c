#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "app/workspace.h"

#include "core/environment.h"
#include "core/log.h"
#include "core/notice_queue.h"
#include "core/options.h"
#include "core/paths.h"

#include "theme/source_registry.h"
#include "theme/theme_synchronizer.h"

static volatile std::sig_atomic_t g_InterruptRequested = 0;

static void HandleInterruptSignal(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
        g_InterruptRequested = 1;
}

static std::int64_t WallClockMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

static void EraseLastCodepoint(std::string& s)
{
    if (s.empty())
        return;
    size_t i = s.size() - 1;
    while (i > 0 && (((unsigned char)s[i]) & 0xC0) == 0x80)
        --i;
    s.erase(i);
}

static std::string TabLabel(const omnote::TabState& t)
{
    std::string name = "Untitled";
    if (!t.file_path.empty())
    {
        const size_t slash = t.file_path.find_last_of('/');
        name = (slash == std::string::npos) ? t.file_path : t.file_path.substr(slash + 1);
    }
    return t.dirty ? ("*" + name) : name;
}

// Modal question for one recoverable tab. Runs before the main window exists.
static bool AskRecoverTab(const omnote::RecoveredTab& rt)
{
    const std::string what = rt.tab.file_path.empty() ? std::string("an untitled document") : rt.tab.file_path;
    const std::string message = "OmNote found unsaved changes to " + what + " (" +
                                std::to_string(rt.content.size()) + " bytes).\n\nRestore them?";

    const SDL_MessageBoxButtonData buttons[] = {
        {SDL_MESSAGEBOX_BUTTON_ESCAPEKEY_DEFAULT, 0, "Discard"},
        {SDL_MESSAGEBOX_BUTTON_RETURNKEY_DEFAULT, 1, "Restore"},
    };
    SDL_MessageBoxData data{};
    data.flags = SDL_MESSAGEBOX_WARNING;
    data.window = nullptr;
    data.title = "Recover unsaved changes";
    data.message = message.c_str();
    data.numbuttons = (int)SDL_arraysize(buttons);
    data.buttons = buttons;

    int button = 1;
    if (!SDL_ShowMessageBox(&data, &button))
    {
        // No way to ask: keep the text rather than lose it.
        OMNOTE_LOG_WARN("recovery", "SDL_ShowMessageBox(): %s; restoring", SDL_GetError());
        return true;
    }
    return button == 1;
}

static omnote::WindowGeometry ReadWindowGeometry(SDL_Window* window, const omnote::WindowGeometry& prev)
{
    omnote::WindowGeometry g = prev;
    g.maximized = (SDL_GetWindowFlags(window) & SDL_WINDOW_MAXIMIZED) != 0;
    // Keep the restored size/position while maximized.
    if (!g.maximized)
    {
        int w = 0, h = 0, x = 0, y = 0;
        if (SDL_GetWindowSize(window, &w, &h) && w > 0 && h > 0)
        {
            g.width = w;
            g.height = h;
        }
        if (SDL_GetWindowPosition(window, &x, &y))
        {
            g.x = x;
            g.y = y;
        }
    }
    return g;
}

int main(int argc, char** argv)
{
    std::signal(SIGINT, HandleInterruptSignal);
    std::signal(SIGTERM, HandleInterruptSignal);

    const omnote::Environment env = omnote::CaptureEnvironment();
    omnote::RuntimeOptions opts;
    {
        std::string err;
        if (!omnote::ParseCommandLine(argc, argv, env, opts, err))
        {
            std::fprintf(stderr, "[omnote] %s\n", err.c_str());
            omnote::PrintUsage(argv[0]);
            return 2;
        }
    }
    if (opts.show_help)
    {
        omnote::PrintUsage(argv[0]);
        return 0;
    }

    const omnote::AppPaths paths = omnote::ResolveAppPaths(env);
    {
        std::string err;
        if (!omnote::log::Init(paths.DebugLogPath(), opts.debug, err))
            std::fprintf(stderr, "[log] %s\n", err.c_str());
    }
    OMNOTE_LOG_INFO("omnote", "Starting (config %s, cache %s)", paths.config_dir.c_str(), paths.cache_dir.c_str());

    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        OMNOTE_LOG_ERROR("sdl", "SDL_Init(): %s", SDL_GetError());
        omnote::log::Shutdown();
        return 1;
    }

    omnote::NoticeQueue notices;
    omnote::Workspace workspace(paths, opts.timings, &notices);
    workspace.Restore(AskRecoverTab, WallClockMs());
    if (workspace.Session().tabs.empty())
        workspace.OpenTab();

    // The persisted mode applies unless the command line / environment forces one.
    const bool forced_system =
        opts.force_system_theme || workspace.Session().theme_mode == omnote::theme::ThemeMode::ForcedSystem;

    omnote::theme::ThemeSynchronizer::Options sync_opts;
    sync_opts.force_system = forced_system;
    sync_opts.watch_enabled = opts.watch_enabled;
    sync_opts.watch.debounce = opts.timings.watch_debounce;
    sync_opts.watch.max_latency = opts.timings.watch_max_latency;
    sync_opts.watch.poll_interval = opts.timings.watch_poll_interval;
    omnote::theme::ThemeSynchronizer theme_sync(
        [paths, env]() { return omnote::theme::SourceRegistry::BuildDefault(paths, env); }, env, sync_opts);

    // Theme changes resolved on the watcher thread wake the event loop.
    const Uint32 theme_event = SDL_RegisterEvents(1);
    if (theme_event != 0)
    {
        theme_sync.SetWakeCallback([theme_event]() {
            SDL_Event ev;
            SDL_zero(ev);
            ev.type = theme_event;
            if (!SDL_PushEvent(&ev))
                OMNOTE_LOG_DEBUG("sdl", "SDL_PushEvent(): %s", SDL_GetError());
        });
    }

    omnote::theme::ThemeSpec theme = theme_sync.Current();
    theme_sync.Subscribe([&theme](const omnote::theme::ThemeSpec& spec) {
        theme = spec;
        OMNOTE_LOG_INFO("theme", "Applied %s", omnote::theme::DescribeThemeSpec(spec).c_str());
    });
    theme_sync.Start();

    // Window, from the saved geometry (bounded so bad state can't create a 0px or enormous window).
    const omnote::WindowGeometry& saved = workspace.Session().window;
    auto clamp_i = [](int v, int lo, int hi) -> int { return (v < lo) ? lo : (v > hi) ? hi : v; };
    SDL_Window* window = SDL_CreateWindow("OmNote",
                                          clamp_i(saved.width, 320, 16384),
                                          clamp_i(saved.height, 240, 16384),
                                          SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN);
    if (window == nullptr)
    {
        OMNOTE_LOG_ERROR("sdl", "SDL_CreateWindow(): %s", SDL_GetError());
        theme_sync.Stop();
        SDL_Quit();
        omnote::log::Shutdown();
        return 1;
    }
    if (saved.x && saved.y)
        SDL_SetWindowPosition(window, *saved.x, *saved.y);
    else
        SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
    if (saved.maximized)
        SDL_MaximizeWindow(window);
    SDL_ShowWindow(window);

    SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
    if (renderer == nullptr)
    {
        OMNOTE_LOG_ERROR("sdl", "SDL_CreateRenderer(): %s", SDL_GetError());
        SDL_DestroyWindow(window);
        theme_sync.Stop();
        SDL_Quit();
        omnote::log::Shutdown();
        return 1;
    }
    SDL_StartTextInput(window);

    std::string status;
    std::string last_title;
    bool done = false;
    while (!done)
    {
        SDL_Event event;
        bool have_event = SDL_WaitEventTimeout(&event, 100);
        while (have_event)
        {
            const auto now = std::chrono::steady_clock::now();
            const omnote::TabState* active = workspace.ActiveTab();

            switch (event.type)
            {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                done = true;
                break;

            case SDL_EVENT_WINDOW_RESIZED:
            case SDL_EVENT_WINDOW_MOVED:
            case SDL_EVENT_WINDOW_MAXIMIZED:
            case SDL_EVENT_WINDOW_RESTORED:
                workspace.SetGeometry(ReadWindowGeometry(window, workspace.Session().window));
                break;

            case SDL_EVENT_DROP_FILE:
                if (event.drop.data)
                {
                    std::uint64_t tab_id = 0;
                    std::string err;
                    if (!workspace.OpenFile(event.drop.data, tab_id, err))
                        status = "Open failed: " + err;
                }
                break;

            case SDL_EVENT_TEXT_INPUT:
                if (active)
                {
                    const std::uint64_t id = active->tab_id;
                    std::string text = *workspace.Buffer(id);
                    text += event.text.text;
                    const std::uint64_t size = text.size();
                    workspace.Edit(id, std::move(text), now);
                    workspace.MoveCursor(id, size, workspace.ActiveTab()->scroll_offset);
                }
                break;

            case SDL_EVENT_KEY_DOWN:
            {
                const bool ctrl = (event.key.mod & SDL_KMOD_CTRL) != 0;
                const SDL_Keycode key = event.key.key;
                if (ctrl && key == SDLK_S && active)
                {
                    std::string err;
                    status = workspace.SaveTab(active->tab_id, err) ? std::string("Saved") : ("Save failed: " + err);
                }
                else if (ctrl && key == SDLK_N)
                {
                    workspace.OpenTab();
                }
                else if (ctrl && key == SDLK_W && active)
                {
                    workspace.CloseTab(active->tab_id);
                    if (workspace.Session().tabs.empty())
                        workspace.OpenTab();
                }
                else if (ctrl && key == SDLK_TAB)
                {
                    const int n = (int)workspace.Session().tabs.size();
                    if (n > 0)
                        workspace.SetActiveTab((workspace.Session().active_tab_index + 1) % n);
                }
                else if (ctrl && key == SDLK_L && active)
                {
                    workspace.SetShowLineNumbers(active->tab_id, !active->show_line_numbers);
                }
                else if (key == SDLK_F2)
                {
                    const bool force = !theme_sync.IsForcedSystem();
                    theme_sync.SetForcedSystem(force);
                    workspace.SetThemeMode(force ? omnote::theme::ThemeMode::ForcedSystem
                                                 : omnote::theme::ThemeMode::Live);
                }
                else if ((key == SDLK_BACKSPACE || key == SDLK_RETURN) && active)
                {
                    const std::uint64_t id = active->tab_id;
                    std::string text = *workspace.Buffer(id);
                    if (key == SDLK_BACKSPACE)
                        EraseLastCodepoint(text);
                    else
                        text += '\n';
                    const std::uint64_t size = text.size();
                    workspace.Edit(id, std::move(text), now);
                    workspace.MoveCursor(id, size, workspace.ActiveTab()->scroll_offset);
                }
                break;
            }

            default:
                if (theme_event != 0 && event.type == theme_event)
                    theme_sync.Poll();
                break;
            }
            have_event = SDL_PollEvent(&event);
        }
        if (g_InterruptRequested)
            done = true;

        theme_sync.Poll();
        workspace.Tick(std::chrono::steady_clock::now());

        omnote::Notice notice;
        while (notices.Poll(notice))
        {
            status = notice.message;
            OMNOTE_LOG_WARN("ui", "%s: %s", omnote::ErrorKindName(notice.kind), notice.message.c_str());
        }

        // Title: tabs, active one bracketed.
        std::string title = "OmNote";
        const omnote::SessionState& st = workspace.Session();
        for (size_t i = 0; i < st.tabs.size(); ++i)
        {
            const std::string label = TabLabel(st.tabs[i]);
            title += ((int)i == st.active_tab_index) ? (" [" + label + "]") : (" " + label);
        }
        if (!status.empty())
            title += " | " + status;
        if (title != last_title)
        {
            SDL_SetWindowTitle(window, title.c_str());
            last_title = title;
        }

        // Paint with the theme colors; the caret bar sits below the last line of the buffer.
        SDL_SetRenderDrawColor(renderer, theme.background.r, theme.background.g, theme.background.b, 255);
        SDL_RenderClear(renderer);
        if (const omnote::TabState* t = workspace.ActiveTab())
        {
            int w = 0, h = 0;
            SDL_GetWindowSize(window, &w, &h);
            const std::string* text = workspace.Buffer(t->tab_id);
            const size_t lines = text ? (size_t)std::count(text->begin(), text->end(), '\n') : 0;
            const float line_h = 18.0f;
            const float gutter = t->show_line_numbers ? 40.0f : 0.0f;
            if (gutter > 0.0f)
            {
                SDL_SetRenderDrawColor(renderer,
                                       theme.selection_background.r,
                                       theme.selection_background.g,
                                       theme.selection_background.b,
                                       255);
                const SDL_FRect gutter_rect{0.0f, 0.0f, gutter, (float)h};
                SDL_RenderFillRect(renderer, &gutter_rect);
            }
            SDL_SetRenderDrawColor(renderer, theme.cursor.r, theme.cursor.g, theme.cursor.b, 255);
            const float y = std::min((float)h - line_h, 8.0f + line_h * (float)lines);
            const SDL_FRect caret{gutter + 8.0f, y, 2.0f, line_h};
            SDL_RenderFillRect(renderer, &caret);
            SDL_SetRenderDrawColor(renderer, theme.accent.r, theme.accent.g, theme.accent.b, 255);
            const SDL_FRect accent_bar{0.0f, (float)h - 3.0f, (float)w, 3.0f};
            SDL_RenderFillRect(renderer, &accent_bar);
        }
        SDL_RenderPresent(renderer);
    }

    // ---------------------------------------------------------------------
    // Shutdown / persistence
    // ---------------------------------------------------------------------
    theme_sync.Stop();
    workspace.SetGeometry(ReadWindowGeometry(window, workspace.Session().window));
    {
        std::string err;
        if (!workspace.Shutdown(err))
            OMNOTE_LOG_ERROR("state", "Final session save failed: %s", err.c_str());
    }

    SDL_StopTextInput(window);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    OMNOTE_LOG_INFO("omnote", "Exited cleanly");
    omnote::log::Shutdown();
    return 0;
}
