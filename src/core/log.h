#pragma once

#include <string>

// Debug log sink.
//
// Lines look like:
//   2026-10-19 14:03:11.042 WARN  [state] Failed to write session state: No space left on device
//
// Before Init() (and whenever the log file cannot be opened) lines go to stderr, matching
// the "[tag] message" diagnostics used elsewhere. Rotation is someone else's job: the file is
// only ever appended to.
namespace omnote::log
{
enum class Level
{
    Debug = 0,
    Info,
    Warn,
    Error,
};

// Opens `path` for appending (creating parent directories).
// `echo_stderr` mirrors every line to stderr as well (OMNOTE_DEBUG).
// Returns false if the file could not be opened; logging then continues on stderr.
bool Init(const std::string& path, bool echo_stderr, std::string& err);

// Closes the log file. Subsequent lines go to stderr.
void Shutdown();

// Lines below this level are dropped. Default: Info (Debug when echo_stderr was requested).
void SetMinLevel(Level level);

#if defined(__GNUC__) || defined(__clang__)
void Write(Level level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
#else
void Write(Level level, const char* tag, const char* fmt, ...);
#endif
} // namespace omnote::log

#define OMNOTE_LOG_DEBUG(tag, ...) ::omnote::log::Write(::omnote::log::Level::Debug, (tag), __VA_ARGS__)
#define OMNOTE_LOG_INFO(tag, ...) ::omnote::log::Write(::omnote::log::Level::Info, (tag), __VA_ARGS__)
#define OMNOTE_LOG_WARN(tag, ...) ::omnote::log::Write(::omnote::log::Level::Warn, (tag), __VA_ARGS__)
#define OMNOTE_LOG_ERROR(tag, ...) ::omnote::log::Write(::omnote::log::Level::Error, (tag), __VA_ARGS__)
