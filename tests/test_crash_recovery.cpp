#include "test_helpers.h"

#include "session/crash_recovery.h"

using namespace omnote;
using omnote::test::TempDir;
using omnote::test::WriteText;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
static constexpr std::int64_t kNow = 1700000000000;
static constexpr std::int64_t kDayMs = 24 * 3600 * 1000;

struct RecoveryFixture
{
    TempDir dir;
    std::string autosave_dir = dir / "autosave";
    Timings timings;

    void Record(std::uint64_t tab_id, const std::string& text, std::int64_t timestamp_ms,
                const std::string& file_path = std::string())
    {
        AutosaveRecord r;
        r.tab_id = tab_id;
        r.autosave_id = AutosaveIdForTab(tab_id);
        r.timestamp_ms = timestamp_ms;
        r.file_path = file_path;
        r.cursor_offset = text.size();
        std::string err;
        REQUIRE(WriteAutosaveRecord(autosave_dir, r, text, err));
    }

    bool Exists(std::uint64_t tab_id) const
    {
        return fs::exists(AutosaveSidecarPath(autosave_dir, AutosaveIdForTab(tab_id)));
    }

    RecoveryReport Run(SessionState& st, const CrashRecoveryCoordinator::AcceptCallback& accept = nullptr)
    {
        CrashRecoveryCoordinator c(autosave_dir, timings);
        return c.Reconcile(st, accept, kNow);
    }
};

TabState Tab(std::uint64_t id, const std::string& path, bool dirty)
{
    TabState t;
    t.tab_id = id;
    t.file_path = path;
    t.dirty = dirty;
    t.autosave_id = AutosaveIdForTab(id);
    return t;
}
} // namespace

TEST_CASE("Empty or missing autosave directory", "[recovery]")
{
    RecoveryFixture fx;
    SessionState st;
    const RecoveryReport r = fx.Run(st);
    CHECK(r.offered == 0);
    CHECK(r.accepted.empty());
}

TEST_CASE("Records superseded by a clean shutdown are removed", "[recovery]")
{
    RecoveryFixture fx;
    SessionState st;
    st.tabs = {Tab(1, "/tmp/a.txt", false)};
    st.next_tab_id = 2;
    st.clean_shutdown = true;
    fx.Record(1, "old draft", kNow - 1000);

    const RecoveryReport r = fx.Run(st);
    CHECK(r.stale_removed == 1);
    CHECK(r.offered == 0);
    CHECK_FALSE(fx.Exists(1));
    CHECK_FALSE(fs::exists(AutosaveBlobPath(fx.autosave_dir, "tab-1")));
}

TEST_CASE("Dirty tabs and unclean shutdowns are offered", "[recovery]")
{
    RecoveryFixture fx;
    SessionState st;
    st.tabs = {Tab(1, "/tmp/a.txt", true), Tab(2, "/tmp/b.txt", false)};
    st.next_tab_id = 3;
    fx.Record(1, "unsaved a", kNow - 1000, "/tmp/a.txt");
    fx.Record(2, "unsaved b", kNow - 500, "/tmp/b.txt");

    SECTION("clean shutdown: only the dirty tab")
    {
        st.clean_shutdown = true;
        const RecoveryReport r = fx.Run(st);
        CHECK(r.offered == 1);
        CHECK(r.stale_removed == 1);
        REQUIRE(r.accepted.size() == 1);
        CHECK(r.accepted[0].content == "unsaved a");
        CHECK(r.accepted[0].replaces_existing);
        CHECK(r.accepted[0].tab.cursor_offset == 9);
        CHECK(fx.Exists(1));
    }

    SECTION("unclean shutdown: both")
    {
        st.clean_shutdown = false;
        const RecoveryReport r = fx.Run(st);
        CHECK(r.offered == 2);
        REQUIRE(r.accepted.size() == 2);
        // Oldest first.
        CHECK(r.accepted[0].tab.tab_id == 1);
        CHECK(r.accepted[1].tab.tab_id == 2);
        CHECK(st.tabs.size() == 2);
        CHECK(st.tabs[1].dirty);
    }
}

TEST_CASE("A record for a file name that is not UTF-8 is recovered", "[recovery]")
{
    RecoveryFixture fx;
    const std::string latin1 = "/tmp/caf\xe9.txt";
    SessionState st;
    st.clean_shutdown = false;
    st.tabs = {Tab(1, latin1, true)};
    st.next_tab_id = 2;
    fx.Record(1, "UNSAVED WORK", kNow - 1000, latin1);

    AutosaveScan scan;
    std::string err;
    REQUIRE(ScanAutosaveDir(fx.autosave_dir, scan, err));
    CHECK(scan.records.size() == 1);
    CHECK(scan.broken_ids.empty());

    const RecoveryReport r = fx.Run(st);
    CHECK(r.broken_removed == 0);
    REQUIRE(r.accepted.size() == 1);
    CHECK(r.accepted[0].content == "UNSAVED WORK");
    CHECK(r.accepted[0].tab.file_path == latin1);
    CHECK(fx.Exists(1));
}

TEST_CASE("Records for tabs missing from the session", "[recovery]")
{
    RecoveryFixture fx;
    fx.timings.autosave_retention = std::chrono::milliseconds(7 * kDayMs);
    SessionState st;
    st.clean_shutdown = true;
    st.tabs = {Tab(1, "/tmp/a.txt", false)};
    st.next_tab_id = 2;

    fx.Record(9, "closed while dirty", kNow - kDayMs);
    fx.Record(4, "ancient", kNow - 8 * kDayMs);

    const RecoveryReport r = fx.Run(st);
    CHECK(r.expired_purged == 1);
    CHECK_FALSE(fx.Exists(4));
    CHECK(r.offered == 1);
    REQUIRE(r.accepted.size() == 1);
    CHECK_FALSE(r.accepted[0].replaces_existing);
    REQUIRE(st.tabs.size() == 2);
    CHECK(st.tabs[1].tab_id == 9);
    CHECK(st.tabs[1].dirty);
    CHECK(st.next_tab_id == 10);
}

TEST_CASE("Declined records are deleted", "[recovery]")
{
    RecoveryFixture fx;
    SessionState st;
    st.clean_shutdown = false;
    st.tabs = {Tab(1, "/tmp/a.txt", true)};
    st.next_tab_id = 2;
    fx.Record(1, "draft", kNow - 1000, "/tmp/a.txt");
    fx.Record(5, "orphan", kNow - 1000);

    int asked = 0;
    const RecoveryReport r = fx.Run(st, [&](const RecoveredTab&) {
        ++asked;
        return false;
    });
    CHECK(asked == 2);
    CHECK(r.declined == 2);
    CHECK(r.accepted.empty());
    CHECK_FALSE(fx.Exists(1));
    CHECK_FALSE(fx.Exists(5));
    REQUIRE(st.tabs.size() == 1);
    CHECK_FALSE(st.tabs[0].dirty);
    CHECK(st.next_tab_id == 2);
}

TEST_CASE("Broken records are removed", "[recovery]")
{
    RecoveryFixture fx;
    SessionState st;
    st.clean_shutdown = false;

    fx.Record(1, "fine", kNow - 1000);
    // Sidecar without its blob.
    fx.Record(2, "blob goes missing", kNow - 1000);
    fs::remove(AutosaveBlobPath(fx.autosave_dir, "tab-2"));
    // Blob without a sidecar.
    WriteText(AutosaveBlobPath(fx.autosave_dir, "tab-3"), "debris");
    // Sidecar that is not JSON.
    WriteText(AutosaveSidecarPath(fx.autosave_dir, "tab-4"), "{{{");
    WriteText(AutosaveBlobPath(fx.autosave_dir, "tab-4"), "x");

    const RecoveryReport r = fx.Run(st);
    CHECK(r.broken_removed == 3);
    CHECK(r.accepted.size() == 1);
    CHECK_FALSE(fs::exists(AutosaveBlobPath(fx.autosave_dir, "tab-3")));
    CHECK_FALSE(fs::exists(AutosaveSidecarPath(fx.autosave_dir, "tab-4")));
    CHECK(fx.Exists(1));
}

TEST_CASE("A blob newer than its sidecar is kept", "[recovery]")
{
    RecoveryFixture fx;
    SessionState st;
    st.clean_shutdown = false;
    fx.Record(1, "older", kNow - 1000);
    WriteText(AutosaveBlobPath(fx.autosave_dir, "tab-1"), "newer text");

    const RecoveryReport r = fx.Run(st);
    REQUIRE(r.accepted.size() == 1);
    CHECK(r.accepted[0].content == "newer text");
}
