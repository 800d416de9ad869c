#pragma once

#include "core/environment.h"
#include "theme/source_registry.h"
#include "theme/source_watcher.h"
#include "theme/theme_spec.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace omnote::theme
{
// Keeps the applied ThemeSpec in step with the external sources.
//
// Threading:
// - Start(), Poll(), SetForcedSystem(), Subscribe() and the subscriber callbacks belong to
//   the UI thread.
// - Re-resolution after a filesystem change runs on the watcher thread. A result that
//   differs from the last one is parked in a slot; Poll() picks it up and notifies.
// - The optional wake callback is invoked from the watcher thread whenever something was
//   parked, so an event loop blocked in a wait can come around and call Poll().
class ThemeSynchronizer
{
public:
    // Rebuilt on every resolution so a switched Omarchy theme (new directory) is followed.
    using RegistryFactory = std::function<SourceRegistry()>;
    using Subscriber = std::function<void(const ThemeSpec&)>;

    struct Options
    {
        bool force_system = false;
        bool watch_enabled = true;
        SourceWatcher::Options watch;
    };

    ThemeSynchronizer(RegistryFactory registry_factory, Environment env, Options opt);
    ~ThemeSynchronizer();

    ThemeSynchronizer(const ThemeSynchronizer&) = delete;
    ThemeSynchronizer& operator=(const ThemeSynchronizer&) = delete;

    // Resolves once, publishes the result to subscribers, starts watching.
    void Start();

    // Stops watching. Current() stays valid.
    void Stop();

    int Subscribe(Subscriber fn);
    void Unsubscribe(int id);

    void SetWakeCallback(std::function<void()> fn);

    // Applies a spec resolved in the background, if any. Returns true when subscribers were
    // notified of a new appearance.
    bool Poll();

    // live <-> forced-system. Watching stops while forced and resumes afterwards; the theme is
    // re-resolved and published immediately.
    void SetForcedSystem(bool forced);

    // Re-resolves synchronously on the calling (UI) thread.
    void Refresh();

    const ThemeSpec& Current() const { return current_; }
    bool IsForcedSystem() const { return forced_.load(); }
    bool IsWatching() const { return watcher_ != nullptr && watcher_->IsRunning(); }
    bool IsPollingFallback() const { return watcher_ != nullptr && watcher_->IsPolling(); }
    std::uint64_t ResolutionCount() const { return resolutions_.load(); }

private:
    ThemeSpec ResolveNow(SourceRegistry& registry_out);
    void OnSourcesChanged();
    void StartWatching(const SourceRegistry& registry);
    void StopWatching();
    void Apply(const ThemeSpec& spec);

    RegistryFactory registry_factory_;
    Environment env_;
    Options opt_;

    std::atomic<bool> forced_{false};
    std::atomic<std::uint64_t> resolutions_{0};

    ThemeSpec current_;
    std::vector<std::pair<int, Subscriber>> subscribers_;
    int next_subscriber_id_ = 1;

    std::unique_ptr<SourceWatcher> watcher_;

    std::mutex mtx_;
    ThemeSpec last_resolved_;               // guarded by mtx_
    std::optional<ThemeSpec> pending_;      // guarded by mtx_
    std::function<void()> wake_;            // guarded by mtx_
};
} // namespace omnote::theme
