#pragma once

#include <string>
#include <unordered_map>

namespace omnote
{
// Snapshot of the process environment.
//
// Everything that reads environment variables takes one of these instead of calling
// getenv() directly, so theme resolution stays a pure function of its inputs and tests
// can supply their own variables.
using Environment = std::unordered_map<std::string, std::string>;

// Copies `environ` into a map.
Environment CaptureEnvironment();

// Returns the value of `name`, or an empty string when unset or empty.
std::string EnvOrEmpty(const Environment& env, const char* name);

// True when `name` is set to a truthy value ("1", "true", "yes", "on"; case-insensitive).
bool EnvFlag(const Environment& env, const char* name);
} // namespace omnote
