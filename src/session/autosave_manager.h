#pragma once

#include "core/notice_queue.h"
#include "core/options.h"
#include "io/background_writer.h"
#include "io/session/autosave_record.h"
#include "io/session/session_state.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace omnote
{
// Debounced per-tab autosave.
//
// An edit arms the tab's timer: the snapshot is taken after `autosave_idle` without further
// edits, but no later than `autosave_max_latency` after the first edit of the burst. Timers
// are evaluated by Tick() on the UI thread, which pulls the buffer text through the content
// provider and hands the write to a background writer (one job per tab; a newer job replaces
// a queued one).
class AutosaveManager
{
public:
    using Clock = std::chrono::steady_clock;

    // Fills `out` with the current text of `tab_id`. Returns false if the tab has no buffer.
    using ContentProvider = std::function<bool(std::uint64_t tab_id, std::string& out)>;

    // Wall clock for record timestamps, ms since epoch.
    using WallClock = std::function<std::int64_t()>;

    AutosaveManager(std::string dir, Timings timings, NoticeQueue* notices, ContentProvider content);
    ~AutosaveManager();

    AutosaveManager(const AutosaveManager&) = delete;
    AutosaveManager& operator=(const AutosaveManager&) = delete;

    void SetWallClock(WallClock clock) { wall_clock_ = std::move(clock); }

    // Starts (or refreshes) tracking of a tab. Cursor/scroll/file path are copied into the
    // next record written for it. `known_hash` is the hash of a record already on disk
    // (after recovery) so identical content is not rewritten.
    void TrackTab(const TabState& tab, const std::string& known_hash = std::string());

    void NoteEdit(std::uint64_t tab_id, Clock::time_point now);

    // Writes every tab whose timer has expired, and retries failed writes.
    void Tick(Clock::time_point now);

    // Stops tracking. Clean: pending timer dropped and the record deleted. Dirty: the
    // latest content is written and the record is kept for recovery; if that write fails
    // it is retried by later ticks.
    void CloseTab(std::uint64_t tab_id, bool dirty);

    // The tab was saved to its file: its record is no longer needed.
    void DiscardRecord(std::uint64_t tab_id);

    // Writes every armed tab now and waits for the writer (shutdown).
    void FlushAll();

    // Waits for queued writes.
    void Flush();

    bool IsTracked(std::uint64_t tab_id) const { return tabs_.count(tab_id) != 0; }
    bool HasPendingEdit(std::uint64_t tab_id) const;
    std::optional<Clock::time_point> DueTime(std::uint64_t tab_id) const;

    std::uint64_t WriteCount() const;
    std::uint64_t SkippedCount() const { return skipped_; }
    const std::string& Dir() const { return dir_; }

private:
    struct TabSlot
    {
        TabState info;
        bool armed = false;
        Clock::time_point first_edit{};
        Clock::time_point last_edit{};
        std::string last_hash;      // of the last snapshot handed to the writer
        std::int64_t last_timestamp_ms = 0;
    };

    struct FailedWrite
    {
        AutosaveRecord record;
        std::string content;
        std::uint64_t job = 0;
    };

    Clock::time_point DueOf(const TabSlot& slot) const;
    void WriteSlot(TabSlot& slot);
    void SubmitWrite(AutosaveRecord record, std::string content, std::uint64_t job);
    void SubmitRemoval(const std::string& autosave_id);
    std::int64_t NowMs() const;

    std::string dir_;
    Timings timings_;
    NoticeQueue* notices_ = nullptr;
    ContentProvider content_;
    WallClock wall_clock_;

    std::map<std::uint64_t, TabSlot> tabs_;
    // Last job submitted per autosave id; a failed write is retried only while it is the latest.
    std::map<std::string, std::uint64_t> latest_job_;
    std::uint64_t next_job_ = 0;
    std::uint64_t skipped_ = 0;

    mutable std::mutex result_mtx_;
    std::vector<FailedWrite> failed_writes_; // guarded by result_mtx_
    std::uint64_t writes_ = 0;               // guarded by result_mtx_

    BackgroundWriter writer_{"autosave"};
};
} // namespace omnote
