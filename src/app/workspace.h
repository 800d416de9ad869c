#pragma once

#include "core/notice_queue.h"
#include "core/options.h"
#include "core/paths.h"
#include "session/autosave_manager.h"
#include "session/crash_recovery.h"
#include "session/state_store.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace omnote
{
// Open documents plus everything that keeps them across restarts.
//
// The UI drives this from its single thread: tab lifecycle, buffer edits, explicit saves,
// geometry. Persistence (session state, autosave, crash recovery) is wired underneath.
class Workspace
{
public:
    using Clock = std::chrono::steady_clock;

    Workspace(AppPaths paths, Timings timings, NoticeQueue* notices);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Startup: loads the session, reconciles autosave records (asking `accept` about each
    // recoverable tab), loads the remaining tabs from their files, and marks the session as
    // running (clean_shutdown=false) on disk.
    RecoveryReport Restore(const CrashRecoveryCoordinator::AcceptCallback& accept, std::int64_t now_ms);

    // New untitled tab, made active. Returns its id.
    std::uint64_t OpenTab();

    // Opens `path` in a new tab, or activates the tab that already shows it.
    bool OpenFile(const std::string& path, std::uint64_t& tab_id, std::string& err);

    // Replaces the tab's buffer with `text` and marks it dirty.
    bool Edit(std::uint64_t tab_id, std::string text, Clock::time_point now);

    void MoveCursor(std::uint64_t tab_id, std::uint64_t cursor_offset, std::uint64_t scroll_offset);
    void SetShowLineNumbers(std::uint64_t tab_id, bool show);

    // Writes the buffer to the tab's file (atomically) and clears dirty.
    bool SaveTab(std::uint64_t tab_id, std::string& err);
    bool SaveTabAs(std::uint64_t tab_id, const std::string& path, std::string& err);

    // Dirty tabs keep their autosave record, so the text can still be recovered later.
    void CloseTab(std::uint64_t tab_id);

    void SetActiveTab(int index);
    void SetGeometry(const WindowGeometry& geometry);
    void SetThemeMode(theme::ThemeMode mode);

    // Drives autosave timers and the periodic state save. Call from the UI loop.
    void Tick(Clock::time_point now);

    // Orderly exit: final autosaves, clean_shutdown=true, synchronous state write.
    bool Shutdown(std::string& err);

    const std::string* Buffer(std::uint64_t tab_id) const;
    const SessionState& Session() const { return store_.State(); }
    const TabState* ActiveTab() const;

    StateStore& Store() { return store_; }
    AutosaveManager& Autosave() { return autosave_; }

private:
    TabState* MutableTab(std::uint64_t tab_id, SessionState& st);

    AppPaths paths_;
    Timings timings_;
    NoticeQueue* notices_ = nullptr;

    std::map<std::uint64_t, std::string> buffers_;

    StateStore store_;
    AutosaveManager autosave_;
};
} // namespace omnote
