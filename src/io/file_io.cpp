#include "io/file_io.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace omnote::file_io
{
namespace fs = std::filesystem;

bool ReadFileText(const std::string& path, std::string& out, std::string& err, std::size_t limit_bytes)
{
    err.clear();
    out.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open file for reading: " + path;
        return false;
    }
    in.seekg(0, std::ios::end);
    const std::streamoff sz = in.tellg();
    if (sz < 0)
    {
        err = "Failed to read file size: " + path;
        return false;
    }
    if ((std::uint64_t)sz > (std::uint64_t)limit_bytes)
    {
        err = "File too large: " + path;
        return false;
    }
    in.seekg(0, std::ios::beg);
    out.resize((size_t)sz);
    if (sz > 0)
        in.read(out.data(), sz);
    if (!in && sz > 0)
    {
        err = "Failed to read file contents: " + path;
        out.clear();
        return false;
    }
    return true;
}

bool EnsureParentDirExists(const std::string& path, std::string& err)
{
    err.clear();
    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
    return true;
}

static bool WriteAll(int fd, std::string_view data)
{
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0)
    {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += n;
        left -= (size_t)n;
    }
    return true;
}

static void SyncDirectory(const fs::path& dir)
{
    // Makes the rename itself durable. Not every filesystem supports fsync on a directory;
    // a failure here does not invalidate the write.
    const std::string d = dir.empty() ? std::string(".") : dir.string();
    const int dfd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0)
        return;
    (void)::fsync(dfd);
    ::close(dfd);
}

bool WriteFileAtomic(const std::string& path, std::string_view contents, std::string& err)
{
    err.clear();

    std::string derr;
    if (!EnsureParentDirExists(path, derr))
    {
        err = "Failed to create directory: " + derr;
        return false;
    }

    const std::string tmp_path = path + ".tmp";
    const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        err = "Failed to open temp file for writing: " + std::string(std::strerror(errno));
        return false;
    }

    if (!WriteAll(fd, contents))
    {
        err = "Failed to write temp file: " + std::string(std::strerror(errno));
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return false;
    }
    if (::fsync(fd) != 0)
    {
        err = "Failed to flush temp file: " + std::string(std::strerror(errno));
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return false;
    }
    if (::close(fd) != 0)
    {
        err = "Failed to finalize temp file: " + std::string(std::strerror(errno));
        ::unlink(tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = "Failed to atomically replace " + path + ": " + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }

    SyncDirectory(fs::path(path).parent_path());
    return true;
}

bool RemoveFile(const std::string& path, std::string& err)
{
    err.clear();
    if (path.empty())
        return true;
    std::error_code ec;
    fs::remove(fs::path(path), ec);
    if (ec)
    {
        err = ec.message();
        return false;
    }
    return true;
}
} // namespace omnote::file_io
