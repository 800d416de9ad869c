#pragma once

#include "core/environment.h"
#include "theme/source_registry.h"
#include "theme/theme_spec.h"

namespace omnote::theme
{
// Computes the ThemeSpec for the current inputs.
//
// Walks `registry` in priority order and takes the first source with a usable palette
// (background + foreground), completes it from the system defaults, then applies the
// OMNOTE_*/MICROPAD_* color overrides per key. With `force_system` the sources and the
// overrides are skipped and the system default is returned.
//
// Reads only the registry's files (and their imports); no other side effects besides
// debug log lines. Never fails: the system default is always available.
ThemeSpec ResolveTheme(const SourceRegistry& registry, const Environment& env, bool force_system);
} // namespace omnote::theme
