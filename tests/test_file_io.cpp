#include "test_helpers.h"

#include "core/content_hash.h"
#include "io/file_io.h"

using namespace omnote;
using omnote::test::ReadText;
using omnote::test::TempDir;
using omnote::test::WriteText;
namespace fs = std::filesystem;

TEST_CASE("Atomic writes", "[file_io]")
{
    TempDir dir;
    const std::string path = dir / "nested/deeper/file.txt";
    std::string err;

    REQUIRE(file_io::WriteFileAtomic(path, "first", err));
    CHECK(ReadText(path) == "first");

    REQUIRE(file_io::WriteFileAtomic(path, "second", err));
    CHECK(ReadText(path) == "second");
    CHECK_FALSE(fs::exists(path + ".tmp"));

    SECTION("failure leaves the old contents")
    {
        fs::create_directories(path + ".tmp");
        CHECK_FALSE(file_io::WriteFileAtomic(path, "third", err));
        CHECK_FALSE(err.empty());
        CHECK(ReadText(path) == "second");
    }
}

TEST_CASE("Reading files", "[file_io]")
{
    TempDir dir;
    std::string out, err;

    SECTION("missing")
    {
        CHECK_FALSE(file_io::ReadFileText(dir / "nope", out, err));
        CHECK_FALSE(err.empty());
    }

    SECTION("empty")
    {
        WriteText(dir / "empty", "");
        REQUIRE(file_io::ReadFileText(dir / "empty", out, err));
        CHECK(out.empty());
    }

    SECTION("size limit")
    {
        WriteText(dir / "big", std::string(100, 'x'));
        CHECK_FALSE(file_io::ReadFileText(dir / "big", out, err, 50));
        REQUIRE(file_io::ReadFileText(dir / "big", out, err, 100));
        CHECK(out.size() == 100);
    }
}

TEST_CASE("Removing files", "[file_io]")
{
    TempDir dir;
    std::string err;
    WriteText(dir / "a", "x");
    CHECK(file_io::RemoveFile(dir / "a", err));
    CHECK_FALSE(fs::exists(dir / "a"));
    CHECK(file_io::RemoveFile(dir / "a", err));
}

TEST_CASE("Content hash", "[file_io][hash]")
{
    const std::string a = ContentHashHex("hello");
    CHECK(a.size() == 32);
    CHECK(a == ContentHashHex("hello"));
    CHECK(a != ContentHashHex("hello "));
    CHECK(a.find_first_not_of("0123456789abcdef") == std::string::npos);
}
