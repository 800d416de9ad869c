#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace omnote::theme
{
// One inotify watch: a directory, and the entry names in it that matter.
struct WatchHandle
{
    std::string path;
    int wd = -1;
    bool whole_dir = false;          // any event in the directory counts
    std::set<std::string> names;     // otherwise only events on these entries count
    std::chrono::steady_clock::time_point last_event{};
};

// Watches a set of file/directory paths and reports "something changed" after a quiet
// period.
//
// Each path is covered by a watch on its parent directory (so atomic rename-replace and
// creation are seen), plus a watch on the path itself when it is a directory. Parents that
// do not exist yet are covered through their nearest existing ancestor; watches are rebuilt
// after every notification so newly created directories get picked up.
//
// All events within `debounce` of each other collapse into one callback, fired `debounce`
// after the last event but never later than `max_latency` after the first one.
// The callback runs on the watcher thread; events arriving while it runs produce exactly
// one follow-up callback.
//
// If inotify is unavailable (or force_polling is set) the watcher polls existence, size
// and mtime every `poll_interval` instead.
class SourceWatcher
{
public:
    using Callback = std::function<void()>;

    struct Options
    {
        std::chrono::milliseconds debounce{250};
        std::chrono::milliseconds max_latency{1000};
        std::chrono::milliseconds poll_interval{2000};
        bool force_polling = false;
    };

    SourceWatcher(std::vector<std::string> paths, Options opt, Callback on_change);
    ~SourceWatcher();

    SourceWatcher(const SourceWatcher&) = delete;
    SourceWatcher& operator=(const SourceWatcher&) = delete;

    // Sets up watches and starts the thread. Falling back to polling is not a failure; only
    // an unusable wake-up channel is.
    bool Start(std::string& err);

    // Cancels watches and any pending debounce, joins the thread. No callback runs after
    // Stop() returns.
    void Stop();

    // Replaces the watched path set. Takes effect at the next rebuild (after the current
    // notification, or immediately when called from the callback).
    void SetPaths(std::vector<std::string> paths);

    bool IsRunning() const { return running_.load(); }
    bool IsPolling() const { return polling_.load(); }

    size_t WatchCount() const;
    std::uint64_t NotificationCount() const { return notifications_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    // Shallow fingerprint of a path for the polling fallback.
    struct Stamp
    {
        bool exists = false;
        std::uintmax_t size = 0;
        std::int64_t mtime = 0;
        std::string detail; // symlink target / directory entry list

        bool operator==(const Stamp& o) const
        {
            return exists == o.exists && size == o.size && mtime == o.mtime && detail == o.detail;
        }
        bool operator!=(const Stamp& o) const { return !(*this == o); }
    };

    void RebuildWatches();
    void ClearWatches();
    void EnterPollingMode(const std::string& reason);
    bool HandleInotifyEvents(Clock::time_point now);
    bool PollForChanges();
    void Run();

    static Stamp StampOf(const std::string& path);

    std::vector<std::string> PathsSnapshot() const;

    std::vector<std::string> paths_; // guarded by watches_mtx_
    Options opt_;
    Callback on_change_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> polling_{false};
    std::atomic<std::uint64_t> notifications_{0};

    int inotify_fd_ = -1;
    int wake_fd_ = -1;

    mutable std::mutex watches_mtx_;
    std::map<int, WatchHandle> watches_;

    std::map<std::string, Stamp> stamps_;
};
} // namespace omnote::theme
