#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace omnote::file_io
{
// Upper bound for reading config/state/autosave text. Anything bigger is not ours.
static constexpr std::size_t kDefaultReadLimit = 64u * 1024u * 1024u;

// Reads a whole file. Fails (with err) if missing, unreadable, or larger than limit_bytes.
bool ReadFileText(const std::string& path,
                  std::string& out,
                  std::string& err,
                  std::size_t limit_bytes = kDefaultReadLimit);

// Creates the parent directory of `path` if needed.
bool EnsureParentDirExists(const std::string& path, std::string& err);

// Atomic replace: writes `<path>.tmp` in the same directory, fsyncs it, renames it over
// `path` and fsyncs the directory. On failure the previous contents of `path` are untouched
// and the temp file is removed (best effort).
bool WriteFileAtomic(const std::string& path, std::string_view contents, std::string& err);

// Removes `path`. A file that is already gone counts as success.
bool RemoveFile(const std::string& path, std::string& err);
} // namespace omnote::file_io
