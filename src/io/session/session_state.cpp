#include "io/session/session_state.h"

#include "io/file_io.h"
#include "io/session/path_json.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace omnote
{
TabState* SessionState::FindTab(std::uint64_t tab_id)
{
    for (auto& t : tabs)
        if (t.tab_id == tab_id)
            return &t;
    return nullptr;
}

const TabState* SessionState::FindTab(std::uint64_t tab_id) const
{
    for (const auto& t : tabs)
        if (t.tab_id == tab_id)
            return &t;
    return nullptr;
}

int SessionState::IndexOfTab(std::uint64_t tab_id) const
{
    for (size_t i = 0; i < tabs.size(); ++i)
        if (tabs[i].tab_id == tab_id)
            return (int)i;
    return -1;
}

void SessionState::ClampActiveIndex()
{
    if (tabs.empty() || active_tab_index < 0 || active_tab_index >= (int)tabs.size())
        active_tab_index = 0;
}

std::string AutosaveIdForTab(std::uint64_t tab_id)
{
    return "tab-" + std::to_string(tab_id);
}

static json ToJson(const SessionState& st)
{
    json j;
    j["schema_version"] = kSessionSchemaVersion;

    json tabs = json::array();
    for (const auto& t : st.tabs)
    {
        json jt;
        jt["tab_id"] = t.tab_id;
        path_json::WritePath(jt, "file_path", t.file_path);
        jt["cursor_offset"] = t.cursor_offset;
        jt["scroll_offset"] = t.scroll_offset;
        jt["dirty"] = t.dirty;
        jt["autosave_id"] = t.autosave_id;
        jt["show_line_numbers"] = t.show_line_numbers;
        tabs.push_back(std::move(jt));
    }
    j["tabs"] = std::move(tabs);
    j["active_tab_index"] = st.active_tab_index;

    json geom;
    geom["width"] = st.window.width;
    geom["height"] = st.window.height;
    geom["maximized"] = st.window.maximized;
    geom["x"] = st.window.x ? json(*st.window.x) : json(nullptr);
    geom["y"] = st.window.y ? json(*st.window.y) : json(nullptr);
    j["geometry"] = std::move(geom);

    j["theme_mode"] = theme::ThemeModeName(st.theme_mode);
    j["next_tab_id"] = st.next_tab_id;
    j["clean_shutdown"] = st.clean_shutdown;
    return j;
}

namespace
{
// Field readers: absent (or null where allowed) keeps the default; wrong type fails.
static bool ReadBool(const json& o, const char* key, bool& out, std::string& err)
{
    if (!o.contains(key))
        return true;
    if (!o[key].is_boolean())
    {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = o[key].get<bool>();
    return true;
}

static bool ReadInt(const json& o, const char* key, int& out, std::string& err)
{
    if (!o.contains(key))
        return true;
    const json& v = o[key];
    if (!v.is_number_integer())
    {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    const long long x = v.get<long long>();
    if (x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max())
    {
        err = std::string("'") + key + "' is out of range";
        return false;
    }
    out = (int)x;
    return true;
}

static bool ReadOptionalInt(const json& o, const char* key, std::optional<int>& out, std::string& err)
{
    if (!o.contains(key) || o[key].is_null())
        return true;
    int v = 0;
    if (!ReadInt(o, key, v, err))
        return false;
    out = v;
    return true;
}

static bool ReadU64(const json& o, const char* key, std::uint64_t& out, std::string& err)
{
    if (!o.contains(key))
        return true;
    const json& v = o[key];
    if (v.is_number_unsigned())
    {
        out = v.get<std::uint64_t>();
        return true;
    }
    if (v.is_number_integer() && v.get<long long>() >= 0)
    {
        out = (std::uint64_t)v.get<long long>();
        return true;
    }
    err = std::string("'") + key + "' must be a non-negative integer";
    return false;
}

static bool ReadOptionalString(const json& o, const char* key, std::string& out, std::string& err)
{
    if (!o.contains(key) || o[key].is_null())
        return true;
    if (!o[key].is_string())
    {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = o[key].get<std::string>();
    return true;
}

static bool TabFromJson(const json& jt, TabState& t, bool& has_id, std::string& err)
{
    if (!jt.is_object())
    {
        err = "tab entry is not an object";
        return false;
    }
    has_id = jt.contains("tab_id");
    return ReadU64(jt, "tab_id", t.tab_id, err) &&
           path_json::ReadPath(jt, "file_path", t.file_path, err) &&
           ReadU64(jt, "cursor_offset", t.cursor_offset, err) &&
           ReadU64(jt, "scroll_offset", t.scroll_offset, err) &&
           ReadBool(jt, "dirty", t.dirty, err) &&
           ReadOptionalString(jt, "autosave_id", t.autosave_id, err) &&
           ReadBool(jt, "show_line_numbers", t.show_line_numbers, err);
}

static bool FromJson(const json& j, SessionState& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "document is not a JSON object";
        return false;
    }

    if (j.contains("schema_version") && !j["schema_version"].is_number_integer())
    {
        err = "'schema_version' must be an integer";
        return false;
    }

    if (j.contains("geometry") && !j["geometry"].is_null())
    {
        const json& g = j["geometry"];
        if (!g.is_object())
        {
            err = "'geometry' must be an object";
            return false;
        }
        if (!ReadInt(g, "width", out.window.width, err) ||
            !ReadInt(g, "height", out.window.height, err) ||
            !ReadBool(g, "maximized", out.window.maximized, err) ||
            !ReadOptionalInt(g, "x", out.window.x, err) ||
            !ReadOptionalInt(g, "y", out.window.y, err))
        {
            err = "geometry: " + err;
            return false;
        }
    }

    if (!ReadU64(j, "next_tab_id", out.next_tab_id, err) ||
        !ReadBool(j, "clean_shutdown", out.clean_shutdown, err) ||
        !ReadInt(j, "active_tab_index", out.active_tab_index, err))
        return false;

    if (j.contains("theme_mode"))
    {
        if (!j["theme_mode"].is_string())
        {
            err = "'theme_mode' must be a string";
            return false;
        }
        // Only the user's preference is kept: anything but forced-system means "follow sources".
        const auto mode = theme::ThemeModeFromName(j["theme_mode"].get<std::string>());
        out.theme_mode = (mode && *mode == theme::ThemeMode::ForcedSystem) ? theme::ThemeMode::ForcedSystem
                                                                           : theme::ThemeMode::Live;
    }

    std::vector<size_t> missing_ids;
    if (j.contains("tabs"))
    {
        const json& tabs = j["tabs"];
        if (!tabs.is_array())
        {
            err = "'tabs' must be an array";
            return false;
        }
        for (size_t i = 0; i < tabs.size(); ++i)
        {
            TabState t;
            bool has_id = false;
            if (!TabFromJson(tabs[i], t, has_id, err))
            {
                err = "tabs[" + std::to_string(i) + "]: " + err;
                return false;
            }
            if (!has_id || t.tab_id == 0)
                missing_ids.push_back(out.tabs.size());
            out.tabs.push_back(std::move(t));
        }
    }
    else if (j.contains("path") && !j["path"].is_null())
    {
        // MicroPad single-file format.
        if (!j["path"].is_string())
        {
            err = "'path' must be a string";
            return false;
        }
        TabState t;
        if (!path_json::ReadPath(j, "path", t.file_path, err))
            return false;
        missing_ids.push_back(out.tabs.size());
        out.tabs.push_back(std::move(t));
    }

    // Ids must be unique and below next_tab_id.
    std::uint64_t max_id = 0;
    for (size_t i = 0; i < out.tabs.size(); ++i)
    {
        if (std::find(missing_ids.begin(), missing_ids.end(), i) != missing_ids.end())
            continue;
        for (size_t k = 0; k < i; ++k)
        {
            if (out.tabs[k].tab_id == out.tabs[i].tab_id)
            {
                err = "duplicate tab_id " + std::to_string(out.tabs[i].tab_id);
                return false;
            }
        }
        if (out.tabs[i].tab_id == std::numeric_limits<std::uint64_t>::max())
        {
            err = "tab_id " + std::to_string(out.tabs[i].tab_id) + " is out of range";
            return false;
        }
        max_id = std::max(max_id, out.tabs[i].tab_id);
    }
    if (out.next_tab_id <= max_id)
        out.next_tab_id = max_id + 1;
    if (missing_ids.size() >= std::numeric_limits<std::uint64_t>::max() - out.next_tab_id)
    {
        err = "next_tab_id " + std::to_string(out.next_tab_id) + " is out of range";
        return false;
    }
    for (size_t idx : missing_ids)
        out.tabs[idx].tab_id = out.next_tab_id++;
    for (auto& t : out.tabs)
    {
        if (t.autosave_id.empty())
            t.autosave_id = AutosaveIdForTab(t.tab_id);
    }

    out.ClampActiveIndex();
    return true;
}
} // namespace

std::string SessionStateToJsonText(const SessionState& st)
{
    return ToJson(st).dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

bool SessionStateFromJsonText(const std::string& text, SessionState& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse session state: ") + e.what();
        return false;
    }

    SessionState st;
    try
    {
        if (!FromJson(j, st, err))
        {
            err = "Invalid session state: " + err;
            return false;
        }
    }
    catch (const std::exception& e)
    {
        err = std::string("Invalid session state: ") + e.what();
        return false;
    }
    out = std::move(st);
    return true;
}

bool LoadSessionStateFile(const std::string& path, SessionState& out, bool& existed, std::string& err)
{
    err.clear();
    out = SessionState{};

    std::error_code ec;
    existed = fs::exists(path, ec);
    if (!existed)
        return true;

    std::string text;
    if (!file_io::ReadFileText(path, text, err))
        return false;
    return SessionStateFromJsonText(text, out, err);
}

bool SaveSessionStateFile(const std::string& path, const SessionState& st, std::string& err)
{
    std::string text;
    try
    {
        text = SessionStateToJsonText(st);
    }
    catch (const std::exception& e)
    {
        // Invalid UTF-8 in a path, for instance.
        err = std::string("Failed to serialize session state: ") + e.what();
        return false;
    }
    return file_io::WriteFileAtomic(path, text, err);
}

bool MigrateLegacyStateFile(const AppPaths& paths, bool& migrated, std::string& err)
{
    err.clear();
    migrated = false;

    std::error_code ec;
    const std::string target = paths.StatePath();
    const std::string legacy = paths.LegacyStatePath();
    if (fs::exists(target, ec) || !fs::exists(legacy, ec))
        return true;

    std::string text;
    if (!file_io::ReadFileText(legacy, text, err))
        return false;
    if (!file_io::WriteFileAtomic(target, text, err))
        return false;
    migrated = true;
    return true;
}
} // namespace omnote
