#pragma once

#include "core/paths.h"
#include "theme/theme_spec.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Persistent session state for omnote: open tabs, window geometry and theme mode.
// Stored as JSON in <config_dir>/state.json.
namespace omnote
{
static constexpr int kSessionSchemaVersion = 2;

// Main window geometry (SDL window coordinates). x/y are unset until the window has been
// placed at least once; the window manager decides in that case.
struct WindowGeometry
{
    int  width = 800;
    int  height = 600;
    bool maximized = false;
    std::optional<int> x;
    std::optional<int> y;

    bool operator==(const WindowGeometry& o) const
    {
        return width == o.width && height == o.height && maximized == o.maximized && x == o.x && y == o.y;
    }
};

struct TabState
{
    std::uint64_t tab_id = 0;

    // Empty for an untitled buffer.
    std::string file_path;

    // Byte offsets into the buffer.
    std::uint64_t cursor_offset = 0;
    std::uint64_t scroll_offset = 0;

    // Unsaved edits. Only an explicit save to file_path clears it.
    bool dirty = false;

    // Names this tab's autosave record ("tab-<tab_id>").
    std::string autosave_id;

    bool show_line_numbers = false;

    bool operator==(const TabState& o) const
    {
        return tab_id == o.tab_id && file_path == o.file_path && cursor_offset == o.cursor_offset &&
               scroll_offset == o.scroll_offset && dirty == o.dirty && autosave_id == o.autosave_id &&
               show_line_numbers == o.show_line_numbers;
    }
};

struct SessionState
{
    // Display order.
    std::vector<TabState> tabs;
    int active_tab_index = 0;

    WindowGeometry window;

    // The user's choice: Live (follow the terminal theme) or ForcedSystem.
    theme::ThemeMode theme_mode = theme::ThemeMode::Live;

    std::uint64_t next_tab_id = 1;

    // False while the app runs; the orderly shutdown save writes true.
    bool clean_shutdown = true;

    TabState* FindTab(std::uint64_t tab_id);
    const TabState* FindTab(std::uint64_t tab_id) const;
    int IndexOfTab(std::uint64_t tab_id) const; // -1 if absent

    // 0 when there are no tabs or the index is out of range.
    void ClampActiveIndex();

    bool operator==(const SessionState& o) const
    {
        return tabs == o.tabs && active_tab_index == o.active_tab_index && window == o.window &&
               theme_mode == o.theme_mode && next_tab_id == o.next_tab_id && clean_shutdown == o.clean_shutdown;
    }
    bool operator!=(const SessionState& o) const { return !(*this == o); }
};

// "tab-<id>"
std::string AutosaveIdForTab(std::uint64_t tab_id);

std::string SessionStateToJsonText(const SessionState& st);

// Validates and converts a state document. Unknown fields are ignored; a known field of the
// wrong type (or a document that is not a JSON object) fails with err.
// Accepts the legacy single-file form {"path": ..., "geometry": {...}} as one tab.
bool SessionStateFromJsonText(const std::string& text, SessionState& out, std::string& err);

// Reads `path`. `existed` is false (and out is the default) when the file is absent;
// that is not an error.
bool LoadSessionStateFile(const std::string& path, SessionState& out, bool& existed, std::string& err);

// Atomic replace of `path`.
bool SaveSessionStateFile(const std::string& path, const SessionState& st, std::string& err);

// One-time copy of the legacy MicroPad state file to the omnote location. Does nothing when
// the omnote file already exists or there is no legacy file. The legacy file is left alone.
bool MigrateLegacyStateFile(const AppPaths& paths, bool& migrated, std::string& err);
} // namespace omnote
