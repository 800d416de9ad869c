#include "theme/source_watcher.h"

#include "core/log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace omnote::theme
{
namespace fs = std::filesystem;

namespace
{
static constexpr std::uint32_t kDirMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM |
                                          IN_MOVED_TO | IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF;

static int MillisUntil(std::chrono::steady_clock::time_point deadline, std::chrono::steady_clock::time_point now)
{
    if (deadline <= now)
        return 0;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    // Round up so we don't wake a hair early and spin.
    return (int)std::min<long long>(ms + 1, 60 * 60 * 1000);
}

static std::int64_t MtimeOf(const fs::path& p)
{
    std::error_code ec;
    const auto t = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    return (std::int64_t)t.time_since_epoch().count();
}
} // namespace

SourceWatcher::SourceWatcher(std::vector<std::string> paths, Options opt, Callback on_change)
    : paths_(std::move(paths)),
      opt_(opt),
      on_change_(std::move(on_change))
{
}

SourceWatcher::~SourceWatcher()
{
    Stop();
}

void SourceWatcher::SetPaths(std::vector<std::string> paths)
{
    std::lock_guard<std::mutex> lock(watches_mtx_);
    paths_ = std::move(paths);
}

std::vector<std::string> SourceWatcher::PathsSnapshot() const
{
    std::lock_guard<std::mutex> lock(watches_mtx_);
    return paths_;
}

size_t SourceWatcher::WatchCount() const
{
    std::lock_guard<std::mutex> lock(watches_mtx_);
    return watches_.size();
}

SourceWatcher::Stamp SourceWatcher::StampOf(const std::string& path)
{
    Stamp s;
    std::error_code ec;
    const fs::path p(path);

    const fs::file_status link_st = fs::symlink_status(p, ec);
    if (!ec && fs::is_symlink(link_st))
    {
        const fs::path target = fs::read_symlink(p, ec);
        if (!ec)
            s.detail = "-> " + target.string() + "\n";
    }

    const fs::file_status st = fs::status(p, ec);
    if (ec || !fs::exists(st))
        return s;
    s.exists = true;
    s.mtime = MtimeOf(p);

    if (fs::is_regular_file(st))
    {
        s.size = fs::file_size(p, ec);
        if (ec)
            s.size = 0;
    }
    else if (fs::is_directory(st))
    {
        std::vector<std::string> entries;
        for (fs::directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code fec;
            const std::uintmax_t size = it->is_regular_file(fec) ? it->file_size(fec) : 0;
            entries.push_back(it->path().filename().string() + ":" + std::to_string(size) + ":" +
                              std::to_string(MtimeOf(it->path())));
        }
        std::sort(entries.begin(), entries.end());
        for (const auto& e : entries)
            s.detail += e + "\n";
    }
    return s;
}

void SourceWatcher::EnterPollingMode(const std::string& reason)
{
    OMNOTE_LOG_WARN("watch",
                    "WatchFailure: %s; polling every %lld ms instead",
                    reason.c_str(),
                    (long long)opt_.poll_interval.count());
    ClearWatches();
    if (inotify_fd_ >= 0)
    {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    polling_ = true;
    stamps_.clear();
    for (const auto& p : PathsSnapshot())
        stamps_[p] = StampOf(p);
}

void SourceWatcher::ClearWatches()
{
    std::lock_guard<std::mutex> lock(watches_mtx_);
    if (inotify_fd_ >= 0)
    {
        for (const auto& kv : watches_)
            ::inotify_rm_watch(inotify_fd_, kv.first);
    }
    watches_.clear();
}

void SourceWatcher::RebuildWatches()
{
    if (inotify_fd_ < 0)
        return;

    struct Wanted
    {
        bool whole_dir = false;
        std::set<std::string> names;
    };
    std::map<std::string, Wanted> wanted;

    for (const auto& raw : PathsSnapshot())
    {
        if (raw.empty())
            continue;
        const fs::path p = fs::path(raw).lexically_normal();
        std::error_code ec;
        if (fs::is_directory(p, ec))
            wanted[p.string()].whole_dir = true;

        // Walk up to the nearest existing directory; watch it for the next component down.
        fs::path parent = p.parent_path();
        fs::path child = p.filename();
        while (!parent.empty() && !fs::is_directory(parent, ec))
        {
            child = parent.filename();
            const fs::path up = parent.parent_path();
            if (up == parent)
                break;
            parent = up;
        }
        if (parent.empty() || !fs::is_directory(parent, ec))
            continue;
        wanted[parent.string()].names.insert(child.string());
    }

    std::map<int, WatchHandle> next;
    for (const auto& kv : wanted)
    {
        const int wd = ::inotify_add_watch(inotify_fd_, kv.first.c_str(), kDirMask);
        if (wd < 0)
        {
            const int e = errno;
            if (e == ENOENT || e == ENOTDIR)
            {
                // Vanished between the check and the add; the parent's watch will see it.
                OMNOTE_LOG_DEBUG("watch", "%s disappeared before it could be watched", kv.first.c_str());
                continue;
            }
            EnterPollingMode("inotify_add_watch(" + kv.first + ") failed: " + std::strerror(e));
            return;
        }
        WatchHandle& h = next[wd];
        if (h.path.empty())
            h.path = kv.first;
        h.wd = wd;
        h.whole_dir = h.whole_dir || kv.second.whole_dir;
        h.names.insert(kv.second.names.begin(), kv.second.names.end());
    }

    std::lock_guard<std::mutex> lock(watches_mtx_);
    for (const auto& kv : watches_)
    {
        auto it = next.find(kv.first);
        if (it == next.end())
            ::inotify_rm_watch(inotify_fd_, kv.first);
        else
            it->second.last_event = kv.second.last_event;
    }
    watches_ = std::move(next);
}

bool SourceWatcher::HandleInotifyEvents(Clock::time_point now)
{
    bool relevant = false;
    alignas(struct inotify_event) char buf[8192];

    for (;;)
    {
        const ssize_t n = ::read(inotify_fd_, buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                OMNOTE_LOG_WARN("watch", "inotify read failed: %s", std::strerror(errno));
            break;
        }
        if (n == 0)
            break;

        std::lock_guard<std::mutex> lock(watches_mtx_);
        for (ssize_t off = 0; off < n;)
        {
            const auto* ev = reinterpret_cast<const struct inotify_event*>(buf + off);
            off += (ssize_t)sizeof(struct inotify_event) + (ssize_t)ev->len;

            if (ev->mask & IN_Q_OVERFLOW)
            {
                // Events were lost; assume the worst.
                relevant = true;
                continue;
            }

            auto it = watches_.find(ev->wd);
            if (it == watches_.end())
                continue;
            WatchHandle& h = it->second;

            if (ev->mask & IN_IGNORED)
            {
                // The watched directory itself went away.
                watches_.erase(it);
                relevant = true;
                continue;
            }

            bool hit = h.whole_dir || (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF));
            if (!hit && ev->len > 0)
                hit = h.names.count(std::string(ev->name)) != 0;
            if (hit)
            {
                h.last_event = now;
                relevant = true;
            }
        }
    }
    return relevant;
}

bool SourceWatcher::PollForChanges()
{
    bool changed = false;
    for (const auto& p : PathsSnapshot())
    {
        Stamp s = StampOf(p);
        auto it = stamps_.find(p);
        if (it == stamps_.end())
        {
            // Newly added path: take a baseline, don't report it.
            stamps_.emplace(p, std::move(s));
            continue;
        }
        Stamp& prev = it->second;
        if (s != prev)
        {
            prev = std::move(s);
            changed = true;
        }
    }
    return changed;
}

bool SourceWatcher::Start(std::string& err)
{
    if (thread_.joinable())
        return true;

    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0)
    {
        err = std::string("eventfd failed: ") + std::strerror(errno);
        return false;
    }

    polling_ = false;
    if (opt_.force_polling)
    {
        EnterPollingMode("inotify disabled");
    }
    else
    {
        inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotify_fd_ < 0)
            EnterPollingMode(std::string("inotify_init1 failed: ") + std::strerror(errno));
        else
            RebuildWatches();
    }

    stop_requested_ = false;
    running_ = true;
    try
    {
        thread_ = std::thread([this]() { Run(); });
    }
    catch (const std::system_error& e)
    {
        running_ = false;
        err = std::string("Failed to start watcher thread: ") + e.what();
        ClearWatches();
        if (inotify_fd_ >= 0)
            ::close(inotify_fd_);
        ::close(wake_fd_);
        inotify_fd_ = wake_fd_ = -1;
        return false;
    }

    OMNOTE_LOG_DEBUG("watch",
                     "Watching %zu path(s) with %s",
                     PathsSnapshot().size(),
                     polling_ ? "polling" : (std::to_string(WatchCount()) + " inotify watch(es)").c_str());
    return true;
}

void SourceWatcher::Stop()
{
    if (!thread_.joinable())
        return;

    stop_requested_ = true;
    const std::uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) != (ssize_t)sizeof(one))
        OMNOTE_LOG_WARN("watch", "Failed to wake watcher thread: %s", std::strerror(errno));
    thread_.join();

    ClearWatches();
    if (inotify_fd_ >= 0)
        ::close(inotify_fd_);
    if (wake_fd_ >= 0)
        ::close(wake_fd_);
    inotify_fd_ = wake_fd_ = -1;
    running_ = false;
}

void SourceWatcher::Run()
{
    bool pending = false;
    Clock::time_point first_event{};
    Clock::time_point last_event{};
    Clock::time_point next_poll = Clock::now() + opt_.poll_interval;

    auto note_event = [&](Clock::time_point now) {
        if (!pending)
        {
            pending = true;
            first_event = now;
        }
        last_event = now;
    };

    while (!stop_requested_)
    {
        Clock::time_point now = Clock::now();

        int timeout_ms = -1;
        if (pending)
            timeout_ms = MillisUntil(std::min(last_event + opt_.debounce, first_event + opt_.max_latency), now);
        if (polling_)
        {
            const int t = MillisUntil(next_poll, now);
            timeout_ms = timeout_ms < 0 ? t : std::min(timeout_ms, t);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds++] = {wake_fd_, POLLIN, 0};
        if (inotify_fd_ >= 0)
            fds[nfds++] = {inotify_fd_, POLLIN, 0};

        const int r = ::poll(fds, nfds, timeout_ms);
        if (r < 0)
        {
            if (errno == EINTR)
                continue;
            OMNOTE_LOG_ERROR("watch", "poll failed: %s; live theme updates stopped", std::strerror(errno));
            break;
        }
        if (stop_requested_)
            break;

        now = Clock::now();
        if (fds[0].revents & POLLIN)
        {
            std::uint64_t drained = 0;
            if (::read(wake_fd_, &drained, sizeof(drained)) < 0 && errno != EAGAIN)
                OMNOTE_LOG_WARN("watch", "eventfd read failed: %s", std::strerror(errno));
        }
        if (nfds > 1 && (fds[1].revents & POLLIN) && HandleInotifyEvents(now))
            note_event(now);

        if (polling_ && now >= next_poll)
        {
            next_poll = now + opt_.poll_interval;
            if (PollForChanges())
                note_event(now);
        }

        if (pending && now >= std::min(last_event + opt_.debounce, first_event + opt_.max_latency))
        {
            pending = false;
            ++notifications_;
            on_change_();
            if (!polling_ && !stop_requested_)
                RebuildWatches();
        }
    }
}
} // namespace omnote::theme
