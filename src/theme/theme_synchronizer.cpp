#include "theme/theme_synchronizer.h"

#include "core/log.h"
#include "theme/theme_resolver.h"

#include <algorithm>

namespace omnote::theme
{
ThemeSynchronizer::ThemeSynchronizer(RegistryFactory registry_factory, Environment env, Options opt)
    : registry_factory_(std::move(registry_factory)),
      env_(std::move(env)),
      opt_(opt),
      forced_(opt.force_system)
{
    current_ = CompleteThemeSpec(SystemDefaultPalette(), "system-gtk", ThemeMode::System);
    last_resolved_ = current_;
}

ThemeSynchronizer::~ThemeSynchronizer()
{
    StopWatching();
}

ThemeSpec ThemeSynchronizer::ResolveNow(SourceRegistry& registry_out)
{
    registry_out = registry_factory_ ? registry_factory_() : SourceRegistry();
    ++resolutions_;
    return ResolveTheme(registry_out, env_, forced_.load());
}

void ThemeSynchronizer::Start()
{
    SourceRegistry registry;
    const ThemeSpec spec = ResolveNow(registry);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        last_resolved_ = spec;
        pending_.reset();
    }
    current_ = spec;
    OMNOTE_LOG_INFO("theme", "Initial theme: %s", DescribeThemeSpec(spec).c_str());
    for (auto& s : subscribers_)
        s.second(current_);

    if (!forced_ && opt_.watch_enabled)
        StartWatching(registry);
}

void ThemeSynchronizer::Stop()
{
    StopWatching();
}

int ThemeSynchronizer::Subscribe(Subscriber fn)
{
    const int id = next_subscriber_id_++;
    subscribers_.emplace_back(id, std::move(fn));
    return id;
}

void ThemeSynchronizer::Unsubscribe(int id)
{
    subscribers_.erase(std::remove_if(subscribers_.begin(),
                                      subscribers_.end(),
                                      [id](const auto& s) { return s.first == id; }),
                       subscribers_.end());
}

void ThemeSynchronizer::SetWakeCallback(std::function<void()> fn)
{
    std::lock_guard<std::mutex> lock(mtx_);
    wake_ = std::move(fn);
}

void ThemeSynchronizer::StartWatching(const SourceRegistry& registry)
{
    if (watcher_)
        return;
    watcher_ = std::make_unique<SourceWatcher>(registry.WatchPaths(), opt_.watch, [this]() { OnSourcesChanged(); });
    std::string err;
    if (!watcher_->Start(err))
    {
        OMNOTE_LOG_WARN("theme", "WatchFailure: live theme updates disabled: %s", err.c_str());
        watcher_.reset();
    }
}

void ThemeSynchronizer::StopWatching()
{
    if (!watcher_)
        return;
    watcher_->Stop();
    watcher_.reset();
}

// Watcher thread.
void ThemeSynchronizer::OnSourcesChanged()
{
    if (forced_)
        return;

    SourceRegistry registry;
    const ThemeSpec spec = ResolveNow(registry);

    // The Omarchy theme may have moved to another directory.
    if (watcher_)
        watcher_->SetPaths(registry.WatchPaths());

    std::function<void()> wake;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (spec.SameAppearance(last_resolved_))
        {
            OMNOTE_LOG_DEBUG("theme", "Sources changed, appearance unchanged (%s)", spec.source_id.c_str());
            return;
        }
        last_resolved_ = spec;
        pending_ = spec;
        wake = wake_;
    }
    OMNOTE_LOG_INFO("theme", "Theme changed: %s", DescribeThemeSpec(spec).c_str());
    if (wake)
        wake();
}

void ThemeSynchronizer::Apply(const ThemeSpec& spec)
{
    if (spec.SameAppearance(current_))
        return;
    current_ = spec;
    for (auto& s : subscribers_)
        s.second(current_);
}

bool ThemeSynchronizer::Poll()
{
    std::optional<ThemeSpec> spec;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        spec.swap(pending_);
    }
    if (!spec)
        return false;
    const bool changed = !spec->SameAppearance(current_);
    Apply(*spec);
    return changed;
}

void ThemeSynchronizer::Refresh()
{
    SourceRegistry registry;
    const ThemeSpec spec = ResolveNow(registry);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        last_resolved_ = spec;
        pending_.reset();
    }
    Apply(spec);
}

void ThemeSynchronizer::SetForcedSystem(bool forced)
{
    if (forced == forced_.load())
        return;

    OMNOTE_LOG_INFO("theme", "Theme mode -> %s", forced ? "forced-system" : "live");
    if (forced)
    {
        // Join the watcher first so no background resolution lands after the switch.
        StopWatching();
        forced_ = true;
        Refresh();
        return;
    }

    forced_ = false;
    SourceRegistry registry;
    const ThemeSpec spec = ResolveNow(registry);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        last_resolved_ = spec;
        pending_.reset();
    }
    Apply(spec);
    if (opt_.watch_enabled)
        StartWatching(registry);
}
} // namespace omnote::theme
