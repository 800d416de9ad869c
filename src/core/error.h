#pragma once

namespace omnote
{
// Failure classes of the configuration/state subsystem.
// None of them is fatal; each maps to a degraded-but-safe behavior.
enum class ErrorKind
{
    SourceUnavailable,  // theme source missing/unreadable: skip to the next one
    SourceMalformed,    // theme source has unusable keys: skip keys or the source
    StateCorrupt,       // state.json failed validation: reset to the default session
    PersistenceFailure, // state/autosave write failed: retry on the next scheduled write
    WatchFailure,       // filesystem watch unavailable: poll or disable live sync
};

inline const char* ErrorKindName(ErrorKind k)
{
    switch (k)
    {
    case ErrorKind::SourceUnavailable: return "SourceUnavailable";
    case ErrorKind::SourceMalformed: return "SourceMalformed";
    case ErrorKind::StateCorrupt: return "StateCorrupt";
    case ErrorKind::PersistenceFailure: return "PersistenceFailure";
    case ErrorKind::WatchFailure: return "WatchFailure";
    }
    return "Unknown";
}
} // namespace omnote
