#include "core/environment.h"

#include <cctype>
#include <cstring>

extern char** environ;

namespace omnote
{
Environment CaptureEnvironment()
{
    Environment env;
    if (!environ)
        return env;
    for (char** p = environ; *p; ++p)
    {
        const char* entry = *p;
        const char* eq = std::strchr(entry, '=');
        if (!eq || eq == entry)
            continue;
        env.emplace(std::string(entry, (size_t)(eq - entry)), std::string(eq + 1));
    }
    return env;
}

std::string EnvOrEmpty(const Environment& env, const char* name)
{
    auto it = env.find(name);
    if (it == env.end())
        return std::string();
    return it->second;
}

bool EnvFlag(const Environment& env, const char* name)
{
    std::string v = EnvOrEmpty(env, name);
    for (char& c : v)
        c = (char)std::tolower((unsigned char)c);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
} // namespace omnote
