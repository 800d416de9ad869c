#include "session/crash_recovery.h"

#include "core/log.h"

#include <algorithm>

namespace omnote
{
CrashRecoveryCoordinator::CrashRecoveryCoordinator(std::string autosave_dir, Timings timings)
    : dir_(std::move(autosave_dir)),
      timings_(timings)
{
}

void CrashRecoveryCoordinator::Remove(const std::string& autosave_id, const char* why)
{
    std::string err;
    if (!RemoveAutosaveRecord(dir_, autosave_id, err))
        OMNOTE_LOG_WARN("recovery", "Failed to remove %s record %s: %s", why, autosave_id.c_str(), err.c_str());
    else
        OMNOTE_LOG_DEBUG("recovery", "Removed %s record %s", why, autosave_id.c_str());
}

RecoveryReport CrashRecoveryCoordinator::Reconcile(SessionState& session,
                                                   const AcceptCallback& accept,
                                                   std::int64_t now_ms)
{
    RecoveryReport report;

    AutosaveScan scan;
    std::string err;
    if (!ScanAutosaveDir(dir_, scan, err))
    {
        OMNOTE_LOG_WARN("recovery", "%s", err.c_str());
        return report;
    }

    for (const auto& id : scan.broken_ids)
    {
        OMNOTE_LOG_WARN("recovery", "Autosave record %s is unreadable; removing it", id.c_str());
        Remove(id, "broken");
        ++report.broken_removed;
    }

    std::vector<AutosaveRecord> records = std::move(scan.records);
    std::stable_sort(records.begin(), records.end(), [](const AutosaveRecord& a, const AutosaveRecord& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });

    const std::int64_t retention_ms = (std::int64_t)timings_.autosave_retention.count();
    std::uint64_t max_tab_id = 0;

    for (AutosaveRecord& record : records)
    {
        const TabState* existing = session.FindTab(record.tab_id);
        if (existing)
        {
            if (session.clean_shutdown && !existing->dirty)
            {
                Remove(record.autosave_id, "stale");
                ++report.stale_removed;
                continue;
            }
        }
        else if (now_ms - record.timestamp_ms > retention_ms)
        {
            Remove(record.autosave_id, "expired");
            ++report.expired_purged;
            continue;
        }

        RecoveredTab rt;
        if (!ReadAutosaveBlob(record, rt.content, err))
        {
            OMNOTE_LOG_WARN("recovery", "%s: %s; removing it", record.autosave_id.c_str(), err.c_str());
            Remove(record.autosave_id, "broken");
            ++report.broken_removed;
            continue;
        }

        rt.replaces_existing = existing != nullptr;
        if (existing)
            rt.tab = *existing;
        rt.tab.tab_id = record.tab_id;
        rt.tab.file_path = record.file_path;
        rt.tab.cursor_offset = record.cursor_offset;
        rt.tab.scroll_offset = record.scroll_offset;
        rt.tab.autosave_id = record.autosave_id;
        rt.tab.dirty = true;
        rt.record = record;

        ++report.offered;
        const bool accepted = accept ? accept(rt) : true;
        if (!accepted)
        {
            ++report.declined;
            Remove(record.autosave_id, "declined");
            // The tab reopens from its file; the unsaved text is gone.
            if (TabState* t = session.FindTab(record.tab_id))
                t->dirty = false;
            continue;
        }

        if (TabState* t = session.FindTab(record.tab_id))
            *t = rt.tab;
        else
            session.tabs.push_back(rt.tab);
        max_tab_id = std::max(max_tab_id, record.tab_id);
        OMNOTE_LOG_INFO("recovery",
                        "Recovered tab %llu (%s)",
                        (unsigned long long)record.tab_id,
                        record.file_path.empty() ? "untitled" : record.file_path.c_str());
        report.accepted.push_back(std::move(rt));
    }

    if (session.next_tab_id <= max_tab_id)
        session.next_tab_id = max_tab_id + 1;
    session.ClampActiveIndex();
    return report;
}
} // namespace omnote
