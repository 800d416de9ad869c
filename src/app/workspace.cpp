#include "app/workspace.h"

#include "core/log.h"
#include "io/file_io.h"

#include <algorithm>
#include <filesystem>

namespace omnote
{
namespace fs = std::filesystem;

Workspace::Workspace(AppPaths paths, Timings timings, NoticeQueue* notices)
    : paths_(std::move(paths)),
      timings_(timings),
      notices_(notices),
      store_(paths_, timings_, notices_),
      autosave_(paths_.AutosaveDir(), timings_, notices_, [this](std::uint64_t tab_id, std::string& out) {
          auto it = buffers_.find(tab_id);
          if (it == buffers_.end())
              return false;
          out = it->second;
          return true;
      })
{
}

Workspace::~Workspace()
{
    autosave_.Flush();
    store_.Flush();
}

TabState* Workspace::MutableTab(std::uint64_t tab_id, SessionState& st)
{
    return st.FindTab(tab_id);
}

RecoveryReport Workspace::Restore(const CrashRecoveryCoordinator::AcceptCallback& accept, std::int64_t now_ms)
{
    SessionState st = store_.Load();
    if (!st.clean_shutdown)
        OMNOTE_LOG_WARN("recovery", "Previous session did not shut down cleanly");

    CrashRecoveryCoordinator recovery(paths_.AutosaveDir(), timings_);
    RecoveryReport report = recovery.Reconcile(st, accept, now_ms);

    buffers_.clear();
    std::map<std::uint64_t, std::string> recovered_hash;
    for (auto& rt : report.accepted)
    {
        buffers_[rt.tab.tab_id] = rt.content;
        recovered_hash[rt.tab.tab_id] = rt.record.content_hash;
    }

    std::vector<TabState> kept;
    kept.reserve(st.tabs.size());
    for (auto& t : st.tabs)
    {
        if (buffers_.count(t.tab_id) == 0)
        {
            std::string text;
            if (!t.file_path.empty())
            {
                std::string err;
                if (!file_io::ReadFileText(t.file_path, text, err))
                {
                    OMNOTE_LOG_WARN("state", "Dropping tab %llu: %s", (unsigned long long)t.tab_id, err.c_str());
                    continue;
                }
            }
            // Without a recovered record there is no unsaved text to show.
            t.dirty = false;
            buffers_[t.tab_id] = std::move(text);
        }
        kept.push_back(t);
    }
    const std::uint64_t active_id =
        (st.active_tab_index >= 0 && st.active_tab_index < (int)st.tabs.size()) ? st.tabs[st.active_tab_index].tab_id : 0;
    st.tabs = std::move(kept);
    st.active_tab_index = std::max(0, st.IndexOfTab(active_id));
    st.ClampActiveIndex();

    for (const auto& t : st.tabs)
    {
        auto h = recovered_hash.find(t.tab_id);
        autosave_.TrackTab(t, h == recovered_hash.end() ? std::string() : h->second);
    }

    st.clean_shutdown = false;
    store_.Save(std::move(st));
    std::string err;
    if (!store_.SaveNow(err))
        OMNOTE_LOG_WARN("state", "Could not mark session as running: %s", err.c_str());

    OMNOTE_LOG_INFO("state",
                    "Session restored: %zu tab(s), %zu recovered, %zu declined",
                    store_.State().tabs.size(),
                    report.accepted.size(),
                    report.declined);
    return report;
}

std::uint64_t Workspace::OpenTab()
{
    std::uint64_t id = 0;
    store_.Update(
        [&](SessionState& st) {
            TabState t;
            t.tab_id = st.next_tab_id++;
            t.autosave_id = AutosaveIdForTab(t.tab_id);
            id = t.tab_id;
            st.tabs.push_back(t);
            st.active_tab_index = (int)st.tabs.size() - 1;
            autosave_.TrackTab(t);
        },
        true);
    buffers_[id] = std::string();
    return id;
}

bool Workspace::OpenFile(const std::string& path, std::uint64_t& tab_id, std::string& err)
{
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    const std::string norm = ec ? path : abs.lexically_normal().string();

    const SessionState& cur = store_.State();
    for (size_t i = 0; i < cur.tabs.size(); ++i)
    {
        if (cur.tabs[i].file_path == norm)
        {
            tab_id = cur.tabs[i].tab_id;
            SetActiveTab((int)i);
            return true;
        }
    }

    std::string text;
    if (!file_io::ReadFileText(norm, text, err))
        return false;

    store_.Update(
        [&](SessionState& st) {
            TabState t;
            t.tab_id = st.next_tab_id++;
            t.autosave_id = AutosaveIdForTab(t.tab_id);
            t.file_path = norm;
            tab_id = t.tab_id;
            st.tabs.push_back(t);
            st.active_tab_index = (int)st.tabs.size() - 1;
            autosave_.TrackTab(t);
        },
        true);
    buffers_[tab_id] = std::move(text);
    return true;
}

bool Workspace::Edit(std::uint64_t tab_id, std::string text, Clock::time_point now)
{
    auto it = buffers_.find(tab_id);
    if (it == buffers_.end())
        return false;
    it->second = std::move(text);

    const TabState* t = store_.State().FindTab(tab_id);
    const bool became_dirty = t && !t->dirty;
    store_.Update(
        [&](SessionState& st) {
            if (TabState* tab = MutableTab(tab_id, st))
                tab->dirty = true;
        },
        became_dirty);
    autosave_.NoteEdit(tab_id, now);
    return true;
}

void Workspace::MoveCursor(std::uint64_t tab_id, std::uint64_t cursor_offset, std::uint64_t scroll_offset)
{
    store_.Update([&](SessionState& st) {
        if (TabState* tab = MutableTab(tab_id, st))
        {
            tab->cursor_offset = cursor_offset;
            tab->scroll_offset = scroll_offset;
            autosave_.TrackTab(*tab);
        }
    });
}

void Workspace::SetShowLineNumbers(std::uint64_t tab_id, bool show)
{
    store_.Update([&](SessionState& st) {
        if (TabState* tab = MutableTab(tab_id, st))
            tab->show_line_numbers = show;
    });
}

bool Workspace::SaveTab(std::uint64_t tab_id, std::string& err)
{
    const TabState* t = store_.State().FindTab(tab_id);
    if (!t)
    {
        err = "No such tab.";
        return false;
    }
    if (t->file_path.empty())
    {
        err = "Untitled tab has no file to save to.";
        return false;
    }
    return SaveTabAs(tab_id, t->file_path, err);
}

bool Workspace::SaveTabAs(std::uint64_t tab_id, const std::string& path, std::string& err)
{
    auto it = buffers_.find(tab_id);
    if (it == buffers_.end() || !store_.State().FindTab(tab_id))
    {
        err = "No such tab.";
        return false;
    }
    if (!file_io::WriteFileAtomic(path, it->second, err))
    {
        OMNOTE_LOG_ERROR("state", "Save of %s failed: %s", path.c_str(), err.c_str());
        return false;
    }

    store_.Update(
        [&](SessionState& st) {
            if (TabState* tab = MutableTab(tab_id, st))
            {
                tab->file_path = path;
                tab->dirty = false;
                autosave_.TrackTab(*tab);
            }
        },
        true);
    autosave_.DiscardRecord(tab_id);
    return true;
}

void Workspace::CloseTab(std::uint64_t tab_id)
{
    const TabState* t = store_.State().FindTab(tab_id);
    if (!t)
        return;
    autosave_.CloseTab(tab_id, t->dirty);

    store_.Update(
        [&](SessionState& st) {
            const int idx = st.IndexOfTab(tab_id);
            if (idx < 0)
                return;
            st.tabs.erase(st.tabs.begin() + idx);
            if (st.active_tab_index > idx || st.active_tab_index >= (int)st.tabs.size())
                --st.active_tab_index;
            st.ClampActiveIndex();
        },
        true);
    buffers_.erase(tab_id);
}

void Workspace::SetActiveTab(int index)
{
    store_.Update([&](SessionState& st) {
        st.active_tab_index = index;
        st.ClampActiveIndex();
    });
}

void Workspace::SetGeometry(const WindowGeometry& geometry)
{
    if (store_.State().window == geometry)
        return;
    store_.Update([&](SessionState& st) { st.window = geometry; }, true);
}

void Workspace::SetThemeMode(theme::ThemeMode mode)
{
    store_.Update([&](SessionState& st) { st.theme_mode = mode; }, true);
}

void Workspace::Tick(Clock::time_point now)
{
    autosave_.Tick(now);
    store_.Tick(now);
}

bool Workspace::Shutdown(std::string& err)
{
    autosave_.FlushAll();
    store_.Update([](SessionState& st) { st.clean_shutdown = true; });
    return store_.SaveNow(err);
}

const std::string* Workspace::Buffer(std::uint64_t tab_id) const
{
    auto it = buffers_.find(tab_id);
    return it == buffers_.end() ? nullptr : &it->second;
}

const TabState* Workspace::ActiveTab() const
{
    const SessionState& st = store_.State();
    if (st.tabs.empty())
        return nullptr;
    return &st.tabs[(size_t)st.active_tab_index];
}
} // namespace omnote
