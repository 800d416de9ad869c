#include "session/state_store.h"

#include "core/log.h"

#include <filesystem>

namespace omnote
{
namespace fs = std::filesystem;

static const char* kStateJobKey = "state";

StateStore::StateStore(AppPaths paths, Timings timings, NoticeQueue* notices)
    : paths_(std::move(paths)),
      timings_(timings),
      notices_(notices),
      path_(paths_.StatePath())
{
}

StateStore::~StateStore()
{
    writer_.Stop();
}

const SessionState& StateStore::Load()
{
    loaded_corrupt_ = false;

    bool migrated = false;
    std::string err;
    if (!MigrateLegacyStateFile(paths_, migrated, err))
        OMNOTE_LOG_WARN("state", "Legacy state migration failed: %s", err.c_str());
    else if (migrated)
        OMNOTE_LOG_INFO("state", "Migrated %s -> %s", paths_.LegacyStatePath().c_str(), path_.c_str());

    SessionState st;
    bool existed = false;
    if (!LoadSessionStateFile(path_, st, existed, err))
    {
        loaded_corrupt_ = true;
        OMNOTE_LOG_WARN("state", "StateCorrupt: %s: %s; starting with an empty session", path_.c_str(), err.c_str());

        // Keep the bad file for inspection instead of overwriting it with the next save.
        std::error_code ec;
        fs::rename(path_, path_ + ".corrupt", ec);
        if (ec)
            OMNOTE_LOG_WARN("state", "Could not move aside %s: %s", path_.c_str(), ec.message().c_str());
        st = SessionState{};
    }
    else if (!existed)
    {
        OMNOTE_LOG_DEBUG("state", "No state file at %s", path_.c_str());
    }

    state_ = std::move(st);
    revision_ = 0;
    saved_revision_ = 0;
    write_failed_ = false;
    return state_;
}

void StateStore::Update(const std::function<void(SessionState&)>& fn, bool structural)
{
    fn(state_);
    ++revision_;
    if (structural)
        Save();
}

void StateStore::Save()
{
    Submit();
}

void StateStore::Save(SessionState st)
{
    state_ = std::move(st);
    ++revision_;
    Submit();
}

void StateStore::ReportFailure(const std::string& err)
{
    write_failed_ = true;
    OMNOTE_LOG_ERROR("state", "PersistenceFailure: %s", err.c_str());
    if (notices_)
        notices_->Push(Notice{ErrorKind::PersistenceFailure, "Could not save session: " + err});
}

void StateStore::Submit()
{
    const std::uint64_t rev = revision_;
    writer_.Submit(kStateJobKey, [this, snapshot = state_, rev]() {
        std::string err;
        if (!SaveSessionStateFile(path_, snapshot, err))
        {
            ReportFailure(err);
            return;
        }
        ++write_count_;
        write_failed_ = false;
        std::uint64_t prev = saved_revision_.load();
        while (prev < rev && !saved_revision_.compare_exchange_weak(prev, rev))
        {
        }
    });
}

bool StateStore::SaveNow(std::string& err)
{
    writer_.Cancel(kStateJobKey);
    writer_.Flush();

    if (!SaveSessionStateFile(path_, state_, err))
    {
        ReportFailure(err);
        return false;
    }
    ++write_count_;
    write_failed_ = false;
    saved_revision_ = revision_;
    return true;
}

void StateStore::Tick(Clock::time_point now)
{
    if (!tick_started_)
    {
        tick_started_ = true;
        last_tick_ = now;
        return;
    }
    if (now - last_tick_ < timings_.state_save_interval)
        return;
    last_tick_ = now;

    if (IsDirty() || write_failed_)
    {
        OMNOTE_LOG_DEBUG("state", "Periodic save (revision %llu)", (unsigned long long)revision_);
        Submit();
    }
}

void StateStore::Flush()
{
    writer_.Flush();
}
} // namespace omnote
