#pragma once

#include "core/notice_queue.h"
#include "core/options.h"
#include "core/paths.h"
#include "io/background_writer.h"
#include "io/session/session_state.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace omnote
{
// Owns the SessionState and its file.
//
// Mutations happen on the UI thread through Update(). Writes go through a single background
// writer; requests that pile up while a write is in flight collapse into one write of the
// latest snapshot. A failed write is reported (log + notice) and retried by the next Tick().
class StateStore
{
public:
    using Clock = std::chrono::steady_clock;

    // `notices` may be null (tests).
    StateStore(AppPaths paths, Timings timings, NoticeQueue* notices);
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Reads the state file, migrating the legacy MicroPad file first if needed.
    // A missing file gives the default state; an invalid one is moved aside to
    // state.json.corrupt and also gives the default state. Never fails.
    const SessionState& Load();

    const SessionState& State() const { return state_; }

    // Applies `fn` to the state and marks it changed. A structural change (tab opened,
    // closed or reordered) is saved right away; anything else waits for the periodic tick.
    void Update(const std::function<void(SessionState&)>& fn, bool structural = false);

    // Queues an asynchronous write of the current state.
    void Save();

    // Replaces the state and queues a write.
    void Save(SessionState st);

    // Writes synchronously on the calling thread (shutdown). Any queued write is dropped.
    bool SaveNow(std::string& err);

    // Periodic save: when the interval has elapsed and the state changed since the last
    // successful write (or the last write failed).
    void Tick(Clock::time_point now);

    // Waits for queued writes.
    void Flush();

    bool IsDirty() const { return revision_ != saved_revision_.load(); }
    bool LastWriteFailed() const { return write_failed_.load(); }
    bool LoadedCorrupt() const { return loaded_corrupt_; }
    std::uint64_t WriteCount() const { return write_count_.load(); }
    const std::string& Path() const { return path_; }

private:
    void Submit();
    void ReportFailure(const std::string& err);

    AppPaths paths_;
    Timings timings_;
    NoticeQueue* notices_ = nullptr;
    std::string path_;

    SessionState state_;
    bool loaded_corrupt_ = false;

    std::uint64_t revision_ = 0;
    std::atomic<std::uint64_t> saved_revision_{0};
    std::atomic<bool> write_failed_{false};
    std::atomic<std::uint64_t> write_count_{0};

    Clock::time_point last_tick_{};
    bool tick_started_ = false;

    BackgroundWriter writer_{"state"};
};
} // namespace omnote
