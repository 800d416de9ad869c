#include "theme/theme_resolver.h"

#include "core/log.h"
#include "theme/source_parsers.h"

namespace omnote::theme
{
static const char* kSystemSourceId = "system-gtk";

ThemeSpec ResolveTheme(const SourceRegistry& registry, const Environment& env, bool force_system)
{
    if (force_system)
        return CompleteThemeSpec(SystemDefaultPalette(), kSystemSourceId, ThemeMode::ForcedSystem);

    PartialPalette winner;
    std::string winner_id;
    bool live = false;

    for (const SourceDescriptor& d : registry.Descriptors())
    {
        if (d.parser_kind == ParserKind::SystemGtk)
            break;

        PartialPalette p;
        ErrorKind kind = ErrorKind::SourceUnavailable;
        std::string err;
        if (!LoadSourcePalette(d, env, p, kind, err))
        {
            if (kind == ErrorKind::SourceMalformed)
                OMNOTE_LOG_WARN("theme", "Source %s (%s) skipped: %s", d.id.c_str(), d.filesystem_path.c_str(), err.c_str());
            else
                OMNOTE_LOG_DEBUG("theme", "Source %s unavailable: %s", d.id.c_str(), err.c_str());
            continue;
        }
        winner = std::move(p);
        winner_id = d.id;
        live = true;
        break;
    }

    if (!live)
    {
        winner = SystemDefaultPalette();
        winner_id = kSystemSourceId;
    }

    // Overrides complement whatever won: per key, never a whole replacement.
    winner.OverlayFrom(EnvironmentColors(env));

    ThemeSpec spec = CompleteThemeSpec(winner, winner_id, live ? ThemeMode::Live : ThemeMode::System);
    OMNOTE_LOG_DEBUG("theme", "Resolved: %s", DescribeThemeSpec(spec).c_str());
    return spec;
}
} // namespace omnote::theme
