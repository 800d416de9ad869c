#include "core/log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <mutex>

namespace omnote::log
{
namespace
{
std::mutex g_mutex;
std::FILE* g_file = nullptr;
bool g_echo_stderr = false;
std::atomic<int> g_min_level{(int)Level::Info};

const char* LevelName(Level level)
{
    switch (level)
    {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO ";
    case Level::Warn: return "WARN ";
    case Level::Error: return "ERROR";
    }
    return "?    ";
}

void FormatTimestamp(char* buf, size_t n)
{
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const int ms = (int)(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf, n, "%s.%03d", base, ms);
}
} // namespace

bool Init(const std::string& path, bool echo_stderr, std::string& err)
{
    err.clear();
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file)
    {
        std::fclose(g_file);
        g_file = nullptr;
    }
    g_echo_stderr = echo_stderr;
    if (echo_stderr)
        g_min_level.store((int)Level::Debug);

    std::error_code ec;
    const std::filesystem::path p(path);
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path(), ec);
    if (ec)
    {
        err = "Failed to create log directory: " + ec.message();
        return false;
    }

    g_file = std::fopen(path.c_str(), "a");
    if (!g_file)
    {
        err = "Failed to open debug log: " + path;
        return false;
    }
    return true;
}

void Shutdown()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file)
    {
        std::fclose(g_file);
        g_file = nullptr;
    }
}

void SetMinLevel(Level level)
{
    g_min_level.store((int)level);
}

void Write(Level level, const char* tag, const char* fmt, ...)
{
    if ((int)level < g_min_level.load())
        return;

    char msg[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    char ts[48];
    FormatTimestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file)
    {
        std::fprintf(g_file, "%s %s [%s] %s\n", ts, LevelName(level), tag ? tag : "-", msg);
        std::fflush(g_file);
    }
    if (!g_file || g_echo_stderr)
        std::fprintf(stderr, "[%s] %s\n", tag ? tag : "-", msg);
}
} // namespace omnote::log
