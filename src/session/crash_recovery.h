#pragma once

#include "core/options.h"
#include "io/session/autosave_record.h"
#include "io/session/session_state.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace omnote
{
// A tab rebuilt from an autosave record, offered to the user.
struct RecoveredTab
{
    TabState tab;             // dirty is always true
    std::string content;      // buffer text from the record's blob
    AutosaveRecord record;
    bool replaces_existing = false; // a session tab with the same id exists
};

struct RecoveryReport
{
    size_t stale_removed = 0;   // superseded by a clean save
    size_t expired_purged = 0;  // orphaned and past retention
    size_t broken_removed = 0;  // unreadable sidecar / missing blob
    size_t offered = 0;
    size_t declined = 0;
    std::vector<RecoveredTab> accepted;
};

// Startup reconciliation of the autosave directory against the loaded session.
//
// For every record:
// - tab in the session, session closed cleanly, tab not dirty: stale, deleted;
// - tab in the session and dirty, or the session did not close cleanly: offered;
// - tab not in the session: offered, unless older than the retention period (deleted).
// Accepted tabs replace the session tab with the same id or are appended. Declined
// records are deleted. The user's files are never touched.
class CrashRecoveryCoordinator
{
public:
    // Return true to restore the tab.
    using AcceptCallback = std::function<bool(const RecoveredTab&)>;

    CrashRecoveryCoordinator(std::string autosave_dir, Timings timings);

    RecoveryReport Reconcile(SessionState& session, const AcceptCallback& accept, std::int64_t now_ms);

private:
    void Remove(const std::string& autosave_id, const char* why);

    std::string dir_;
    Timings timings_;
};
} // namespace omnote
