#pragma once

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

#include <unistd.h>

namespace omnote::test
{
namespace fs = std::filesystem;

// Scratch directory, removed on destruction.
struct TempDir
{
    fs::path path;

    explicit TempDir(std::string_view prefix = "omnote")
    {
        static int counter = 0;
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        std::ostringstream name;
        name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
        path = fs::temp_directory_path() / name.str();
        fs::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string operator/(const std::string& rel) const { return (path / rel).string(); }
};

inline void WriteText(const std::string& path, std::string_view text)
{
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    REQUIRE(out.good());
    out << text;
}

inline std::string ReadText(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Polls `pred` until it holds or `timeout` passes.
inline bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
} // namespace omnote::test
