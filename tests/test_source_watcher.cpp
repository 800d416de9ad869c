#include "test_helpers.h"

#include "theme/source_watcher.h"

#include <atomic>

using namespace omnote::theme;
using omnote::test::TempDir;
using omnote::test::WaitUntil;
using omnote::test::WriteText;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{
SourceWatcher::Options FastOptions()
{
    SourceWatcher::Options o;
    o.debounce = 50ms;
    o.max_latency = 400ms;
    o.poll_interval = 30ms;
    return o;
}
} // namespace

TEST_CASE("Rapid writes collapse into one notification", "[watcher]")
{
    TempDir dir;
    const std::string conf = dir / "kitty/kitty.conf";
    WriteText(conf, "background #000000\n");

    std::atomic<int> calls{0};
    SourceWatcher w({conf}, FastOptions(), [&]() { ++calls; });
    std::string err;
    REQUIRE(w.Start(err));
    REQUIRE(w.IsRunning());
    CHECK_FALSE(w.IsPolling());
    CHECK(w.WatchCount() >= 1);

    WriteText(conf, "background #111111\n");
    WriteText(conf, "background #222222\n");

    REQUIRE(WaitUntil([&]() { return calls.load() >= 1; }));
    std::this_thread::sleep_for(200ms);
    CHECK(calls.load() == 1);
    CHECK(w.NotificationCount() == 1);

    w.Stop();
    CHECK_FALSE(w.IsRunning());
}

TEST_CASE("Unrelated files in a watched directory are ignored", "[watcher]")
{
    TempDir dir;
    const std::string conf = dir / "foot/foot.ini";
    WriteText(conf, "[colors]\n");

    std::atomic<int> calls{0};
    SourceWatcher w({conf}, FastOptions(), [&]() { ++calls; });
    std::string err;
    REQUIRE(w.Start(err));

    WriteText(dir / "foot/notes.txt", "hello");
    std::this_thread::sleep_for(200ms);
    CHECK(calls.load() == 0);
}

TEST_CASE("Files appearing under missing directories are seen", "[watcher]")
{
    TempDir dir;
    const std::string conf = dir / "config/alacritty/alacritty.toml";

    std::atomic<int> calls{0};
    SourceWatcher w({conf}, FastOptions(), [&]() { ++calls; });
    std::string err;
    REQUIRE(w.Start(err));

    // The ancestor watch reports the directory, the rebuilt watch reports the file.
    fs::create_directories(dir.path / "config/alacritty");
    REQUIRE(WaitUntil([&]() { return calls.load() >= 1; }));
    const int after_dir = calls.load();

    std::this_thread::sleep_for(100ms);
    WriteText(conf, "[colors.primary]\n");
    REQUIRE(WaitUntil([&]() { return calls.load() > after_dir; }));
}

TEST_CASE("Atomic rename-replace is seen", "[watcher]")
{
    TempDir dir;
    const std::string conf = dir / "kitty.conf";
    WriteText(conf, "background #000000\n");

    std::atomic<int> calls{0};
    SourceWatcher w({conf}, FastOptions(), [&]() { ++calls; });
    std::string err;
    REQUIRE(w.Start(err));

    WriteText(dir / "kitty.conf.new", "background #ffffff\n");
    fs::rename(dir.path / "kitty.conf.new", conf);
    REQUIRE(WaitUntil([&]() { return calls.load() == 1; }));
}

TEST_CASE("Polling fallback detects changes", "[watcher]")
{
    TempDir dir;
    const std::string conf = dir / "foot.ini";
    WriteText(conf, "a");

    SourceWatcher::Options opt = FastOptions();
    opt.force_polling = true;
    std::atomic<int> calls{0};
    SourceWatcher w({conf}, opt, [&]() { ++calls; });
    std::string err;
    REQUIRE(w.Start(err));
    CHECK(w.IsPolling());
    CHECK(w.WatchCount() == 0);

    WriteText(conf, "a longer file");
    REQUIRE(WaitUntil([&]() { return calls.load() == 1; }));

    fs::remove(conf);
    REQUIRE(WaitUntil([&]() { return calls.load() == 2; }));
}

TEST_CASE("No callback after Stop", "[watcher]")
{
    TempDir dir;
    const std::string conf = dir / "kitty.conf";
    WriteText(conf, "x");

    SourceWatcher::Options opt = FastOptions();
    opt.debounce = 300ms;
    std::atomic<int> calls{0};
    SourceWatcher w({conf}, opt, [&]() { ++calls; });
    std::string err;
    REQUIRE(w.Start(err));

    WriteText(conf, "y");
    std::this_thread::sleep_for(50ms);
    w.Stop();
    std::this_thread::sleep_for(400ms);
    CHECK(calls.load() == 0);
}

TEST_CASE("SetPaths from the callback takes effect", "[watcher]")
{
    TempDir dir;
    const std::string first = dir / "a/first.conf";
    const std::string second = dir / "b/second.conf";
    WriteText(first, "1");
    WriteText(second, "1");

    std::atomic<int> calls{0};
    SourceWatcher* self = nullptr;
    SourceWatcher w({first}, FastOptions(), [&]() {
        ++calls;
        self->SetPaths({second});
    });
    self = &w;
    std::string err;
    REQUIRE(w.Start(err));

    WriteText(second, "2");
    std::this_thread::sleep_for(150ms);
    CHECK(calls.load() == 0);

    WriteText(first, "2");
    REQUIRE(WaitUntil([&]() { return calls.load() == 1; }));
    std::this_thread::sleep_for(100ms);

    WriteText(second, "3");
    REQUIRE(WaitUntil([&]() { return calls.load() == 2; }));
}
