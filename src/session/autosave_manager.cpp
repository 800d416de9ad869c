#include "session/autosave_manager.h"

#include "core/content_hash.h"
#include "core/log.h"

#include <algorithm>

namespace omnote
{
AutosaveManager::AutosaveManager(std::string dir, Timings timings, NoticeQueue* notices, ContentProvider content)
    : dir_(std::move(dir)),
      timings_(timings),
      notices_(notices),
      content_(std::move(content))
{
}

AutosaveManager::~AutosaveManager()
{
    writer_.Stop();
}

std::int64_t AutosaveManager::NowMs() const
{
    if (wall_clock_)
        return wall_clock_();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void AutosaveManager::TrackTab(const TabState& tab, const std::string& known_hash)
{
    TabSlot& slot = tabs_[tab.tab_id];
    slot.info = tab;
    if (slot.info.autosave_id.empty())
        slot.info.autosave_id = AutosaveIdForTab(tab.tab_id);
    if (!known_hash.empty())
        slot.last_hash = known_hash;
}

void AutosaveManager::NoteEdit(std::uint64_t tab_id, Clock::time_point now)
{
    auto it = tabs_.find(tab_id);
    if (it == tabs_.end())
        return;
    TabSlot& slot = it->second;
    if (!slot.armed)
    {
        slot.armed = true;
        slot.first_edit = now;
    }
    slot.last_edit = now;
}

AutosaveManager::Clock::time_point AutosaveManager::DueOf(const TabSlot& slot) const
{
    return std::min(slot.last_edit + timings_.autosave_idle, slot.first_edit + timings_.autosave_max_latency);
}

bool AutosaveManager::HasPendingEdit(std::uint64_t tab_id) const
{
    auto it = tabs_.find(tab_id);
    return it != tabs_.end() && it->second.armed;
}

std::optional<AutosaveManager::Clock::time_point> AutosaveManager::DueTime(std::uint64_t tab_id) const
{
    auto it = tabs_.find(tab_id);
    if (it == tabs_.end() || !it->second.armed)
        return std::nullopt;
    return DueOf(it->second);
}

std::uint64_t AutosaveManager::WriteCount() const
{
    std::lock_guard<std::mutex> lock(result_mtx_);
    return writes_;
}

void AutosaveManager::WriteSlot(TabSlot& slot)
{
    slot.armed = false;

    std::string content;
    if (!content_ || !content_(slot.info.tab_id, content))
    {
        OMNOTE_LOG_DEBUG("autosave", "Tab %llu has no buffer; nothing to write", (unsigned long long)slot.info.tab_id);
        return;
    }

    const std::string hash = ContentHashHex(content);
    if (hash == slot.last_hash)
    {
        ++skipped_;
        return;
    }
    slot.last_hash = hash;

    AutosaveRecord record;
    record.tab_id = slot.info.tab_id;
    record.autosave_id = slot.info.autosave_id;
    record.timestamp_ms = std::max(NowMs(), slot.last_timestamp_ms);
    record.file_path = slot.info.file_path;
    record.cursor_offset = slot.info.cursor_offset;
    record.scroll_offset = slot.info.scroll_offset;
    slot.last_timestamp_ms = record.timestamp_ms;

    const std::uint64_t job = ++next_job_;
    latest_job_[record.autosave_id] = job;
    SubmitWrite(std::move(record), std::move(content), job);
}

void AutosaveManager::SubmitWrite(AutosaveRecord record, std::string content, std::uint64_t job)
{
    const std::string key = record.autosave_id;
    writer_.Submit(key, [this, record = std::move(record), content = std::move(content), job]() mutable {
        std::string err;
        if (!WriteAutosaveRecord(dir_, record, content, err))
        {
            OMNOTE_LOG_ERROR("autosave", "PersistenceFailure: %s: %s", record.autosave_id.c_str(), err.c_str());
            if (notices_)
                notices_->Push(Notice{ErrorKind::PersistenceFailure, "Autosave failed: " + err});
            std::lock_guard<std::mutex> lock(result_mtx_);
            failed_writes_.push_back(FailedWrite{std::move(record), std::move(content), job});
            return;
        }
        std::lock_guard<std::mutex> lock(result_mtx_);
        ++writes_;
    });
}

void AutosaveManager::SubmitRemoval(const std::string& autosave_id)
{
    latest_job_[autosave_id] = ++next_job_;
    writer_.Submit(autosave_id, [this, autosave_id]() {
        std::string err;
        if (!RemoveAutosaveRecord(dir_, autosave_id, err))
            OMNOTE_LOG_WARN("autosave", "Failed to remove record %s: %s", autosave_id.c_str(), err.c_str());
    });
}

void AutosaveManager::Tick(Clock::time_point now)
{
    std::vector<FailedWrite> failed;
    {
        std::lock_guard<std::mutex> lock(result_mtx_);
        failed.swap(failed_writes_);
    }
    for (FailedWrite& f : failed)
    {
        // Superseded by a newer write or by a removal.
        auto latest = latest_job_.find(f.record.autosave_id);
        if (latest == latest_job_.end() || latest->second != f.job)
            continue;

        auto it = tabs_.find(f.record.tab_id);
        if (it == tabs_.end())
        {
            // A tab closed with unsaved text: the failed job holds the only copy.
            SubmitWrite(std::move(f.record), std::move(f.content), f.job);
            continue;
        }
        // Forget the hash so the retry is not skipped; due on this tick.
        TabSlot& slot = it->second;
        slot.last_hash.clear();
        if (!slot.armed)
        {
            slot.armed = true;
            slot.first_edit = slot.last_edit = now - timings_.autosave_max_latency;
        }
    }

    for (auto& kv : tabs_)
    {
        TabSlot& slot = kv.second;
        if (slot.armed && now >= DueOf(slot))
            WriteSlot(slot);
    }
}

void AutosaveManager::CloseTab(std::uint64_t tab_id, bool dirty)
{
    auto it = tabs_.find(tab_id);
    if (it == tabs_.end())
        return;

    TabSlot& slot = it->second;
    const std::string autosave_id = slot.info.autosave_id;
    if (dirty)
    {
        // Always written: an earlier snapshot with the same hash may not have reached disk.
        slot.armed = true;
        slot.last_hash.clear();
        WriteSlot(slot);
    }
    else
    {
        SubmitRemoval(autosave_id);
    }
    tabs_.erase(it);
}

void AutosaveManager::DiscardRecord(std::uint64_t tab_id)
{
    auto it = tabs_.find(tab_id);
    if (it == tabs_.end())
        return;
    TabSlot& slot = it->second;
    slot.armed = false;
    slot.last_hash.clear();
    SubmitRemoval(slot.info.autosave_id);
}

void AutosaveManager::FlushAll()
{
    for (auto& kv : tabs_)
    {
        if (kv.second.armed)
            WriteSlot(kv.second);
    }
    writer_.Flush();
}

void AutosaveManager::Flush()
{
    writer_.Flush();
}
} // namespace omnote
